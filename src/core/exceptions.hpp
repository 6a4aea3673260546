#pragma once

#include <stdexcept>
#include <string>

namespace attn {

class AttnException : public std::runtime_error {
public:
    explicit AttnException(const std::string& message) : std::runtime_error(message) {}
    explicit AttnException(const char* message) : std::runtime_error(message) {}
};

class DatabaseError : public AttnException {
public:
    explicit DatabaseError(const std::string& message) 
        : AttnException("Database Error: " + message) {}
};

// Thrown by a channel adapter that could not reach its service at all
class ChannelError : public AttnException {
public:
    explicit ChannelError(const std::string& message) 
        : AttnException("Channel Error: " + message) {}
};

class ValidationError : public AttnException {
public:
    explicit ValidationError(const std::string& message) 
        : AttnException("Validation Error: " + message) {}
};

} // namespace attn
