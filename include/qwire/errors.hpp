/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qwire {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An instruction with no translation rule reached the translator.
class UnsupportedOperationError : public Error {
public:
    explicit UnsupportedOperationError(std::string operation)
        : Error("Operation not supported by QASM backend: " + operation),
          operation_(std::move(operation)) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// Qubit index missing from a user supplied name map.
class NameResolutionError : public Error {
public:
    explicit NameResolutionError(std::size_t qubit)
        : Error("Qubit " + std::to_string(qubit) + " not found in qubit name map"),
          qubit_(qubit) {}

    std::size_t qubit() const { return qubit_; }

private:
    std::size_t qubit_;
};

class ValidationError : public Error {
public:
    using Error::Error;
};

class DecodeShapeError : public Error {
public:
    using Error::Error;
};

class ParameterError : public Error {
public:
    using Error::Error;
};

class CircuitFormatError : public Error {
public:
    using Error::Error;
};

class FileExistsError : public Error {
public:
    explicit FileExistsError(const std::string& path)
        : Error("File " + path + " already exists, use overwrite to replace it") {}
};

} // namespace qwire
