#include "console.hpp"

#include <iostream>

namespace clouddrop {

void Console::println(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << s << std::endl;
}

void Console::print(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << s;
    std::cout.flush();
}

void Console::notify(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::cout << "\r" << s << "\n" << prompt_;
    std::cout.flush();
}

void Console::set_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lk(mu_);
    prompt_ = prompt;
}

} // namespace clouddrop
