// include/JdkManager/Errors.hpp
#ifndef JDKM_ERRORS_HPP
#define JDKM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace JdkManager {

    // Base for every error this library raises on purpose.
    class JdkManagerError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The host OS or CPU has no entry in the platform tables. Not retryable.
    class UnsupportedPlatformError : public JdkManagerError {
    public:
        using JdkManagerError::JdkManagerError;
    };

    // The release registry could not be reached or answered with a non-success status.
    // Retrying is left to the caller.
    class RegistryUnavailableError : public JdkManagerError {
    public:
        explicit RegistryUnavailableError(const std::string& message, long statusCode = 0)
            : JdkManagerError(message), m_statusCode(statusCode) {}

        long statusCode() const { return m_statusCode; }

    private:
        long m_statusCode;
    };

    // A downloaded artifact failed size or checksum verification. The artifact has
    // already been removed from disk when this is thrown.
    class IntegrityVerificationError : public JdkManagerError {
    public:
        using JdkManagerError::JdkManagerError;
    };

} // namespace JdkManager

#endif // JDKM_ERRORS_HPP
