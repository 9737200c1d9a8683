#pragma once

#include "incidentguard/types.hpp"
#include <stdexcept>
#include <string>

namespace incidentguard {

class IncidentGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigurationException : public IncidentGuardException {
public:
    using IncidentGuardException::IncidentGuardException;
};

class InvalidAlertException : public IncidentGuardException {
public:
    using IncidentGuardException::IncidentGuardException;
};

class IncidentNotFoundException : public IncidentGuardException {
public:
    explicit IncidentNotFoundException(IncidentId id)
        : IncidentGuardException("Incident not found: " + std::to_string(id))
        , incident_id_(id) {}

    IncidentId incident_id() const noexcept { return incident_id_; }

private:
    IncidentId incident_id_;
};

// Optimistic lock failure on the incident ledger
class ConcurrentModificationException : public IncidentGuardException {
public:
    ConcurrentModificationException(IncidentId id, Version expected, Version actual)
        : IncidentGuardException(
            "Incident " + std::to_string(id) +
            " expected version " + std::to_string(expected) +
            " but ledger is at " + std::to_string(actual))
        , incident_id_(id)
        , expected_(expected)
        , actual_(actual) {}

    IncidentId incident_id() const noexcept { return incident_id_; }
    Version expected_version() const noexcept { return expected_; }
    Version actual_version() const noexcept { return actual_; }

private:
    IncidentId incident_id_;
    Version expected_;
    Version actual_;
};

class LedgerTimeoutException : public IncidentGuardException {
public:
    explicit LedgerTimeoutException(IncidentId id)
        : IncidentGuardException("Timed out appending to ledger for incident " +
                                 std::to_string(id)) {}
};

class InvalidTransitionException : public IncidentGuardException {
public:
    InvalidTransitionException(IncidentState from, IncidentState to)
        : IncidentGuardException(
            std::string("Invalid incident transition ") +
            to_string(from) + " -> " + to_string(to))
        , from_(from)
        , to_(to) {}

    IncidentState from() const noexcept { return from_; }
    IncidentState to() const noexcept { return to_; }

private:
    IncidentState from_;
    IncidentState to_;
};

} // namespace incidentguard
