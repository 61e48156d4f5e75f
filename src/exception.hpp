#pragma once

#include <stdexcept>
#include <string>

class PlugdbException : public std::runtime_error {
public:
    explicit PlugdbException(const std::string& message)
        : std::runtime_error(message) {}
};

// Thrown when a supervised task runs past its deadline. Retried like any other failure.
class TaskTimeout : public PlugdbException {
public:
    explicit TaskTimeout(const std::string& message)
        : PlugdbException(message) {}
};

// Thrown when the whole run is aborting. Never retried.
class TaskCancelled : public PlugdbException {
public:
    explicit TaskCancelled(const std::string& message)
        : PlugdbException(message) {}
};
