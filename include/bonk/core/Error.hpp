#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bonk::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/**
 * @brief Raised when a reparent would make an object its own ancestor.
 */
class CyclicHierarchyError : public Error {
public:
    CyclicHierarchyError(std::string_view childName, std::string_view parentName);

    std::string_view childName() const noexcept { return m_childName; }
    std::string_view parentName() const noexcept { return m_parentName; }

private:
    static std::string BuildMessage(std::string_view childName, std::string_view parentName);

    std::string m_childName;
    std::string m_parentName;
};

inline std::string CyclicHierarchyError::BuildMessage(std::string_view childName,
                                                      std::string_view parentName) {
    std::string message;
    message.reserve(childName.size() + parentName.size() + 64);
    message.append("Cannot parent '");
    message.append(childName);
    message.append("' under '");
    message.append(parentName);
    message.append("': the hierarchy would contain a cycle");
    return message;
}

inline CyclicHierarchyError::CyclicHierarchyError(std::string_view childName,
                                                  std::string_view parentName)
    : Error(BuildMessage(childName, parentName)),
      m_childName(childName),
      m_parentName(parentName) {}

/**
 * @brief Raised when a scene asks for a physics backend nobody registered.
 */
class UnknownPhysicsBackendError : public Error {
public:
    UnknownPhysicsBackendError(std::string_view backend, const std::vector<std::string>& available);

    std::string_view backend() const noexcept { return m_backend; }

private:
    static std::string BuildMessage(std::string_view backend, const std::vector<std::string>& available);

    std::string m_backend;
};

inline std::string UnknownPhysicsBackendError::BuildMessage(std::string_view backend,
                                                            const std::vector<std::string>& available) {
    std::string message;
    message.append("Physics backend \"");
    message.append(backend);
    message.append("\" not found. Available: ");
    for (std::size_t i = 0; i < available.size(); ++i) {
        if (i > 0) {
            message.append(", ");
        }
        message.append(available[i]);
    }
    return message;
}

inline UnknownPhysicsBackendError::UnknownPhysicsBackendError(std::string_view backend,
                                                              const std::vector<std::string>& available)
    : Error(BuildMessage(backend, available)),
      m_backend(backend) {}

/**
 * @brief Raised by the Require* accessors when a component or behavior is absent.
 *
 * The plain Get* lookups return nullptr instead.
 */
class MissingComponentError : public Error {
public:
    MissingComponentError(std::string_view ownerName, std::string_view kind);

    std::string_view ownerName() const noexcept { return m_ownerName; }
    std::string_view kind() const noexcept { return m_kind; }

private:
    std::string m_ownerName;
    std::string m_kind;
};

inline MissingComponentError::MissingComponentError(std::string_view ownerName, std::string_view kind)
    : Error("GameObject '" + std::string(ownerName) + "' has no " + std::string(kind)),
      m_ownerName(ownerName),
      m_kind(kind) {}

/**
 * @brief Describes a physics event that references a body with no owning GameObject.
 *
 * Scenes log and drop these; they are never thrown out of a frame.
 */
class CollisionRoutingError : public Error {
public:
    explicit CollisionRoutingError(std::uint64_t bodyId);

    std::uint64_t bodyId() const noexcept { return m_bodyId; }

private:
    std::uint64_t m_bodyId;
};

inline CollisionRoutingError::CollisionRoutingError(std::uint64_t bodyId)
    : Error("Physics body " + std::to_string(bodyId) + " has no registered GameObject"),
      m_bodyId(bodyId) {}

class PhysicsError : public Error {
public:
    PhysicsError(std::string_view operation, std::string details);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view operation, const std::string& details);

    std::string m_operation;
    std::string m_details;
};

inline std::string PhysicsError::BuildMessage(std::string_view operation, const std::string& details) {
    std::string message;
    message.reserve(operation.size() + details.size() + 24);
    message.append("Physics error during ");
    message.append(operation);
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline PhysicsError::PhysicsError(std::string_view operation, std::string details)
    : Error(BuildMessage(operation, details)),
      m_operation(operation),
      m_details(std::move(details)) {}

} // namespace bonk::core
