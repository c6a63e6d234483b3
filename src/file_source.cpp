#include "file_source.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace clouddrop {

MemoryFileSource::MemoryFileSource(std::string name, std::vector<uint8_t> data)
    : name_(std::move(name)), data_(std::move(data)) {}

std::vector<uint8_t> MemoryFileSource::read(uint64_t offset, size_t len) {
    if (offset >= data_.size()) return {};
    size_t n = static_cast<size_t>(std::min<uint64_t>(len, data_.size() - offset));
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(n));
}

std::shared_ptr<DiskFileSource> DiskFileSource::open(const std::string& path, std::string& err) {
    std::ifstream probe(path, std::ios::binary | std::ios::ate);
    if (!probe.is_open()) {
        err = "cannot open file: " + path;
        return nullptr;
    }
    auto end = probe.tellg();
    if (end < 0) {
        err = "cannot determine size of: " + path;
        return nullptr;
    }
    probe.close();

    std::string name = path;
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);

    std::shared_ptr<DiskFileSource> src(new DiskFileSource(path, name, static_cast<uint64_t>(end)));
    if (!src->in_.is_open()) {
        err = "cannot open file: " + path;
        return nullptr;
    }
    return src;
}

DiskFileSource::DiskFileSource(std::string path, std::string name, uint64_t size)
    : path_(std::move(path)), name_(std::move(name)), size_(size), in_(path_, std::ios::binary) {}

std::vector<uint8_t> DiskFileSource::read(uint64_t offset, size_t len) {
    if (offset >= size_) return {};
    size_t n = static_cast<size_t>(std::min<uint64_t>(len, size_ - offset));
    std::vector<uint8_t> out(n);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(in_.gcount()) != n) {
        throw std::runtime_error("short read from " + path_ + " at offset " + std::to_string(offset));
    }
    return out;
}

} // namespace clouddrop
