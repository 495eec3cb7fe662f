#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the solver core. The message is prefixed
// with the component that detected the fault.
class FlowShopError : public std::runtime_error
{
public:
    FlowShopError(const std::string& component, const std::string& message) :
            std::runtime_error(component + ": " + message), component(component) {}

    const std::string& getComponent() const { return component; }

private:
    std::string component;
};

// ragged or empty matrix, or a sequence that is not a permutation of the jobs
class DimensionError : public FlowShopError
{
public:
    using FlowShopError::FlowShopError;
};

// negative or non-finite processing time
class DomainError : public FlowShopError
{
public:
    using FlowShopError::FlowShopError;
};

// out-of-range search parameter or unknown method name
class ConfigurationError : public FlowShopError
{
public:
    using FlowShopError::FlowShopError;
};
