#ifndef SHIKAKU_ERRORS_HPP
#define SHIKAKU_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace shikaku {

class ShikakuError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Startup failures. The service never becomes Ready after one of these.
class StartupError : public ShikakuError {
public:
    using ShikakuError::ShikakuError;
};

class ModelNotFound : public StartupError {
public:
    using StartupError::StartupError;
};

class ModelLoadError : public StartupError {
public:
    using StartupError::StartupError;
};

class DatasetNotFound : public StartupError {
public:
    using StartupError::StartupError;
};

class LabelSetEmpty : public StartupError {
public:
    using StartupError::StartupError;
};

// Caused by the client's request; reported as 400.
class InputError : public ShikakuError {
public:
    using ShikakuError::ShikakuError;
};

class DecodeError : public InputError {
public:
    using InputError::InputError;
};

// Caused by the service itself; reported as 500.
class ServiceError : public ShikakuError {
public:
    using ShikakuError::ShikakuError;
};

class ModelNotLoaded : public ServiceError {
public:
    ModelNotLoaded() : ServiceError("Model not loaded") {}
    using ServiceError::ServiceError;
};

class InferenceError : public ServiceError {
public:
    using ServiceError::ServiceError;
};

// Every infer request stayed busy past the wait limit; reported as 503.
class ServiceBusy : public ServiceError {
public:
    using ServiceError::ServiceError;
};

} // namespace shikaku

#endif // SHIKAKU_ERRORS_HPP
