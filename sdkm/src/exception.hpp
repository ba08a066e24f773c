#pragma once

#include <optional>
#include <stdexcept>
#include <string>

class SdkmException : public std::runtime_error {
public:
    explicit SdkmException(const std::string& message)
        : std::runtime_error(message) {}
};

// The SDK root or cache directory cannot be used.
class ConfigurationError : public SdkmException {
public:
    using SdkmException::SdkmException;
};

class MissingPackage : public SdkmException {
public:
    MissingPackage(const std::string& message, std::string identifier, std::optional<std::string> suggestion)
        : SdkmException(message), identifier_(std::move(identifier)), suggestion_(std::move(suggestion)) {}

    const std::string& identifier() const { return identifier_; }
    const std::optional<std::string>& suggestion() const { return suggestion_; }

private:
    std::string identifier_;
    std::optional<std::string> suggestion_;
};

// A cached download is not a readable zip container. The cached file has
// already been removed when this is thrown.
class BadArchive : public SdkmException {
public:
    BadArchive(const std::string& message, std::string source)
        : SdkmException(message), source_(std::move(source)) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

class VerificationFailure : public SdkmException {
public:
    using SdkmException::SdkmException;
};

class IOFailure : public SdkmException {
public:
    using SdkmException::SdkmException;
};

class MalformedVersion : public SdkmException {
public:
    using SdkmException::SdkmException;
};
