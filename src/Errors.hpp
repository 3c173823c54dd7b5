#pragma once

#include <stdexcept>
#include <string>

class ZipwrightError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Value outside a key's accepted domain, or a key outside a parameter set.
class DomainError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

// Stored value kind and incoming value kind disagree for the same key.
class TypeMismatchError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

class NotFoundError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

class MissingTargetError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

class ToolNotFoundError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

class ProcessError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};

class ConfigError : public ZipwrightError {
public:
    using ZipwrightError::ZipwrightError;
};
