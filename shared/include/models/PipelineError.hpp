/**
 * @file PipelineError.hpp
 * Typed failures raised by the pipeline stages. The orchestrator rethrows the first
 * one unchanged; nothing in the core falls back to a default image.
 */
#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind
{
    EmptyForeground,
    InvalidPlacement,
    Compositing,
    OutOfBounds,
    NotFound,
    InvalidImage,
    InvalidBackdrop,
    Encoding,
};

inline const char* toString(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::EmptyForeground: return "EmptyForeground";
        case ErrorKind::InvalidPlacement: return "InvalidPlacement";
        case ErrorKind::Compositing: return "Compositing";
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidImage: return "InvalidImage";
        case ErrorKind::InvalidBackdrop: return "InvalidBackdrop";
        case ErrorKind::Encoding: return "Encoding";
    }
    return "Unknown";
}

class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Cutout has no pixel above the alpha threshold. Terminal for the request.
class EmptyForegroundError : public PipelineError
{
public:
    explicit EmptyForegroundError(const std::string& m) : PipelineError(ErrorKind::EmptyForeground, m) {}
};

// Caller supplied placement override outside its declared range.
class InvalidPlacementError : public PipelineError
{
public:
    explicit InvalidPlacementError(const std::string& m) : PipelineError(ErrorKind::InvalidPlacement, m) {}
};

// Resized foreground would not fit the canvas at the planned position.
class CompositingError : public PipelineError
{
public:
    explicit CompositingError(const std::string& m) : PipelineError(ErrorKind::Compositing, m) {}
};

// Masking region is not inside the image.
class OutOfBoundsError : public PipelineError
{
public:
    explicit OutOfBoundsError(const std::string& m) : PipelineError(ErrorKind::OutOfBounds, m) {}
};

// Unknown backdrop id.
class NotFoundError : public PipelineError
{
public:
    explicit NotFoundError(const std::string& m) : PipelineError(ErrorKind::NotFound, m) {}
};

// Empty buffer or unsupported pixel type.
class InvalidImageError : public PipelineError
{
public:
    explicit InvalidImageError(const std::string& m) : PipelineError(ErrorKind::InvalidImage, m) {}
};

// Duplicate id, unreadable file or malformed manifest while building the registry.
class InvalidBackdropError : public PipelineError
{
public:
    explicit InvalidBackdropError(const std::string& m) : PipelineError(ErrorKind::InvalidBackdrop, m) {}
};

class EncodingError : public PipelineError
{
public:
    explicit EncodingError(const std::string& m) : PipelineError(ErrorKind::Encoding, m) {}
};
