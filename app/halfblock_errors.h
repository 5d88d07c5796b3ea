/*---------------------------------------------------------*/
/*                                                         */
/*   halfblock_errors.h - Typed failures                   */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef HALFBLOCK_ERRORS_H
#define HALFBLOCK_ERRORS_H

#include <stdexcept>
#include <string>

class HalfBlockError : public std::runtime_error {
public:
    explicit HalfBlockError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bytes are not a readable GIF/PNG/JPEG image (or the file could not be read).
class DecodeFailure : public HalfBlockError {
public:
    explicit DecodeFailure(const std::string& msg) : HalfBlockError(msg) {}
};

class ResizeFailure : public HalfBlockError {
public:
    explicit ResizeFailure(const std::string& msg) : HalfBlockError(msg) {}
};

// Color token does not match #RRGGBB after alpha reduction.
class InvalidColorFormat : public HalfBlockError {
public:
    explicit InvalidColorFormat(const std::string& msg) : HalfBlockError(msg) {}
};

// Channel map is missing a key or holds the wrong numeric kind.
class InvalidInput : public HalfBlockError {
public:
    explicit InvalidInput(const std::string& msg) : HalfBlockError(msg) {}
};

class UnsupportedProjection : public HalfBlockError {
public:
    explicit UnsupportedProjection(const std::string& msg) : HalfBlockError(msg) {}
};

class MissingDimensions : public HalfBlockError {
public:
    explicit MissingDimensions(const std::string& msg) : HalfBlockError(msg) {}
};

class UnsupportedEngine : public HalfBlockError {
public:
    explicit UnsupportedEngine(const std::string& msg) : HalfBlockError(msg) {}
};

#endif // HALFBLOCK_ERRORS_H
