#ifndef __CORRMAP_TESTS_COMMON__H_
#define __CORRMAP_TESTS_COMMON__H_

#include <exception>
#include <string>


class TestFailed : public std::exception {
    std::string message;

    public:
    TestFailed(const char *msg) : message {msg} {};
    TestFailed(const std::string& msg) : message {msg} {};

    const char* what() const noexcept override {
        return message.c_str();
    }
};

#endif
