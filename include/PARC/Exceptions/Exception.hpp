#pragma once

#include <stdexcept>
#include <string>

namespace PARC::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by PARC.
    ///
    /// @details
    /// Combinators never throw to report a failed parse; failures travel inside the returned
    /// state. Exceptions are reserved for the entry point and for programming errors detected
    /// while a parser is being built.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with a string message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace PARC::Exceptions
