#pragma once

#include "health_endpoint.hpp"

namespace minekeeper {
namespace health {

// Interface for HealthProber to enable mocking
class IHealthProber {
public:
    virtual ~IHealthProber() = default;

    // Current throughput reported by the worker, or a value <= 0 on any failure.
    // Must not throw for network or data errors.
    virtual double probe(const HealthEndpoint &endpoint) = 0;
};

}  // namespace health
}  // namespace minekeeper
