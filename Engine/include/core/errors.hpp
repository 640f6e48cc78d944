/**
 * @file errors.hpp
 * @brief Exception hierarchy for the tracking engine
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Stonetrail {

class StonetrailError : public std::runtime_error {
public:
    explicit StonetrailError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Database unreachable or a statement failed. Transient; the current step may be retried.
 */
class PersistenceError : public StonetrailError {
public:
    explicit PersistenceError(const std::string& what) : StonetrailError(what) {}
};

/**
 * @brief Embedding, cropping, geocoding or rendering service failed or timed out.
 */
class CollaboratorUnavailable : public StonetrailError {
public:
    CollaboratorUnavailable(const std::string& collaborator, const std::string& what)
        : StonetrailError(collaborator + ": " + what), collaborator_(collaborator) {}

    const std::string& collaborator() const { return collaborator_; }

private:
    std::string collaborator_;
};

class ConfigError : public StonetrailError {
public:
    explicit ConfigError(const std::string& what) : StonetrailError("config: " + what) {}
};

} // namespace Stonetrail
