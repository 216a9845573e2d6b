#ifndef KESTREL_EXCEPTION_H
#define KESTREL_EXCEPTION_H

#include <exception>
#include <stdexcept>
#include <string>

#include "torch/torch.h"

struct KestrelRuntimeException : public std::runtime_error {
   public:
    KestrelRuntimeException(const std::string &message) : runtime_error(message) {}
};

struct InvalidConfigurationException : public KestrelRuntimeException {
   public:
    InvalidConfigurationException(const std::string &message) : KestrelRuntimeException("Invalid configuration: " + message) {}
};

struct IndexOutOfRangeException : public KestrelRuntimeException {
   public:
    IndexOutOfRangeException(const std::string &message) : KestrelRuntimeException(message) {}
};

struct UndefinedTensorException : public KestrelRuntimeException {
   public:
    UndefinedTensorException() : KestrelRuntimeException("Tensor undefined") {}
};

struct NANTensorException : public KestrelRuntimeException {
   public:
    NANTensorException() : KestrelRuntimeException("Tensor contains NANs") {}
    NANTensorException(const std::string &message) : KestrelRuntimeException(message) {}
};

struct TensorSizeMismatchException : public KestrelRuntimeException {
   public:
    TensorSizeMismatchException(torch::Tensor input, std::string message)
        : KestrelRuntimeException(input.defined() ? message + ", got shape " + c10::str(input.sizes()) : message) {}
};

struct UnexpectedNullPtrException : public KestrelRuntimeException {
   public:
    UnexpectedNullPtrException(std::string message = "") : KestrelRuntimeException(message) {}
};

#endif  // KESTREL_EXCEPTION_H
