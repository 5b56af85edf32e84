#pragma once

#include <mutex>
#include <optional>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

namespace sendplus::cli {

// Line input with local echo, and colored output that may be written from
// the io thread while the user is typing.
class Terminal {
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    void ClearScreen();

    // std::nullopt once the input is closed.
    std::optional<std::string> ReadLine();

    void PrintInfo(const std::string& message);
    void PrintNotice(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt();

private:
    std::mutex output_mutex_;
    bool interactive_{false};

#ifdef _WIN32
    HANDLE hIn;
    HANDLE hOut;
    DWORD mode;
#else
    struct termios oldt_;
    struct termios newt_;
#endif
};

} // namespace sendplus::cli
