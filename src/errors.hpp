#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    Fetch,
    Parse,
    Io,
    Decode,
    Unknown
};

const char* error_kind_name(ErrorKind kind);

// Failure local to one page or one image. Carries the URL it happened on.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, std::string subject, const std::string& what)
        : std::runtime_error(what), kind_(kind), subject_(std::move(subject)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& subject() const { return subject_; }

private:
    ErrorKind kind_;
    std::string subject_;
};

class FetchError : public PipelineError {
public:
    FetchError(std::string url, const std::string& what)
        : PipelineError(ErrorKind::Fetch, std::move(url), what) {}
};

class ParseError : public PipelineError {
public:
    ParseError(std::string url, const std::string& what)
        : PipelineError(ErrorKind::Parse, std::move(url), what) {}
};

class IoError : public PipelineError {
public:
    IoError(std::string path, const std::string& what)
        : PipelineError(ErrorKind::Io, std::move(path), what) {}
};

class DecodeError : public PipelineError {
public:
    DecodeError(std::string subject, const std::string& what)
        : PipelineError(ErrorKind::Decode, std::move(subject), what) {}
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
