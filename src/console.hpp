#pragma once

#include <mutex>
#include <string>

namespace clouddrop {

// Serialized stdout writer shared by the CLI thread and io_context handlers.
// Internal diagnostics go to Logger, never here.
class Console {
public:
    void println(const std::string& s);
    void print(const std::string& s);

    // Prints a line that arrives asynchronously, then redraws the prompt.
    void notify(const std::string& s);
    void set_prompt(const std::string& prompt);

private:
    std::mutex mu_;
    std::string prompt_;
};

} // namespace clouddrop
