#include <cli/terminal.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <conio.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace sendplus::cli {

#ifdef _WIN32
Terminal::Terminal() {
    hIn = GetStdHandle(STD_INPUT_HANDLE);
    hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    interactive_ = _isatty(_fileno(stdin)) && GetConsoleMode(hIn, &mode);
    if (interactive_) {
        SetConsoleMode(hIn, mode & ~(ENABLE_ECHO_INPUT | ENABLE_LINE_INPUT));
    }
}

Terminal::~Terminal() {
    if (interactive_) {
        SetConsoleMode(hIn, mode);
    }
}

void Terminal::ClearScreen() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    COORD coordScreen = {0, 0};
    DWORD cCharsWritten;
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    DWORD dwConSize;

    GetConsoleScreenBufferInfo(hOut, &csbi);
    dwConSize = csbi.dwSize.X * csbi.dwSize.Y;

    FillConsoleOutputCharacter(hOut, (TCHAR) ' ', dwConSize, coordScreen, &cCharsWritten);
    GetConsoleScreenBufferInfo(hOut, &csbi);
    FillConsoleOutputAttribute(hOut, csbi.wAttributes, dwConSize, coordScreen, &cCharsWritten);
    SetConsoleCursorPosition(hOut, coordScreen);
}

std::optional<std::string> Terminal::ReadLine() {
    if (!interactive_) {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    }
    std::string line;
    int ch;
    while ((ch = _getch()) != '\r') {
        if (ch == 0x1A) { // Ctrl+Z
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (ch == '\b') {
            if (!line.empty()) {
                line.pop_back();
                std::cout << "\b \b" << std::flush;
            }
        } else {
            line += static_cast<char>(ch);
            std::cout << static_cast<char>(ch) << std::flush;
        }
    }
    std::cout << std::endl;
    return line;
}
#else
Terminal::Terminal() {
    interactive_ = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &oldt_) == 0;
    if (interactive_) {
        newt_ = oldt_;
        newt_.c_lflag &= ~(ICANON | ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &newt_);
    }
}

Terminal::~Terminal() {
    if (interactive_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt_);
    }
}

void Terminal::ClearScreen() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\033[2J\033[H" << std::flush;
}

std::optional<std::string> Terminal::ReadLine() {
    if (!interactive_) {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    }
    std::string line;
    int ch;
    while ((ch = getchar()) != '\n') {
        if (ch == EOF || (ch == 0x04 && line.empty())) { // Ctrl+D
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (ch == '\b' || ch == 0x7F) {
            if (!line.empty()) {
                line.pop_back();
                std::cout << "\b \b" << std::flush;
            }
        } else {
            line += static_cast<char>(ch);
            std::cout << static_cast<char>(ch) << std::flush;
        }
    }
    std::cout << std::endl;
    return line;
}
#endif

void Terminal::PrintInfo(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << message << std::endl;
}

void Terminal::PrintNotice(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
#ifdef _WIN32
    SetConsoleTextAttribute(hOut, FOREGROUND_GREEN);
    std::cout << "\n" << message << std::endl;
    SetConsoleTextAttribute(hOut, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
    std::cout << "\n\033[32m" << message << "\033[0m" << std::endl;
#endif
}

void Terminal::PrintError(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
#ifdef _WIN32
    SetConsoleTextAttribute(hOut, FOREGROUND_RED);
    std::cerr << "[ERROR] " << message << std::endl;
    SetConsoleTextAttribute(hOut, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
#endif
}

void Terminal::PrintPrompt() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "> " << std::flush;
}

} // namespace sendplus::cli
