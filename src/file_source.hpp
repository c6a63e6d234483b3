#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace clouddrop {

// Random-access byte source for an outgoing file. The engine reads one chunk
// at a time and never asks for the whole content.
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual const std::string& name() const = 0;
    virtual uint64_t size() const = 0;

    // Up to len bytes starting at offset. Throws std::runtime_error on I/O failure.
    virtual std::vector<uint8_t> read(uint64_t offset, size_t len) = 0;
};

class MemoryFileSource final : public FileSource {
public:
    MemoryFileSource(std::string name, std::vector<uint8_t> data);

    const std::string& name() const override { return name_; }
    uint64_t size() const override { return data_.size(); }
    std::vector<uint8_t> read(uint64_t offset, size_t len) override;

private:
    std::string name_;
    std::vector<uint8_t> data_;
};

class DiskFileSource final : public FileSource {
public:
    // Returns null and fills err when the file cannot be opened.
    static std::shared_ptr<DiskFileSource> open(const std::string& path, std::string& err);

    const std::string& name() const override { return name_; }
    uint64_t size() const override { return size_; }
    std::vector<uint8_t> read(uint64_t offset, size_t len) override;

private:
    DiskFileSource(std::string path, std::string name, uint64_t size);

    std::string path_;
    std::string name_;
    uint64_t size_ = 0;
    std::ifstream in_;
};

} // namespace clouddrop
