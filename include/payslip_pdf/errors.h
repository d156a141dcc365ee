#pragma once

#include <stdexcept>
#include <string>

namespace payslip_pdf {

enum class ErrorKind {
    FileRead,
    MalformedInput,
    NoRecordsFound,
    Render
};

const char* error_kind_name(ErrorKind kind);

// Base for every per-file conversion failure. Callers at the batch boundary
// catch this and keep going with the next file.
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class FileReadError : public ConversionError {
public:
    explicit FileReadError(const std::string& message)
        : ConversionError(ErrorKind::FileRead, message) {}
};

// The preamble boundary marker ("\n1") is missing from the input.
class MalformedInputError : public ConversionError {
public:
    explicit MalformedInputError(const std::string& message)
        : ConversionError(ErrorKind::MalformedInput, message) {}
};

class NoRecordsFoundError : public ConversionError {
public:
    explicit NoRecordsFoundError(const std::string& message)
        : ConversionError(ErrorKind::NoRecordsFound, message) {}
};

// fatal() is set when a shared resource (the background image, the font)
// could not be loaded. Such an error affects every file in a batch.
class RenderError : public ConversionError {
public:
    explicit RenderError(const std::string& message, bool fatal = false)
        : ConversionError(ErrorKind::Render, message), fatal_(fatal) {}

    bool fatal() const noexcept { return fatal_; }

private:
    bool fatal_;
};

} // namespace payslip_pdf
