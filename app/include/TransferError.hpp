#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <json/json.h>

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Tagged error value reported by scans and transfers.
 *
 * Only the fields belonging to the active kind are meaningful. The JSON form
 * carries a `type` tag plus those fields and is the shape delivered to the UI.
 */
class TransferError {
public:
    enum class Kind {
        SourceNotFound,
        DestinationExists,
        PermissionDenied,
        InsufficientSpace,
        SameLocation,
        DestinationInsideSource,
        SymlinkLoop,
        IoError,
        Cancelled
    };

    static TransferError source_not_found(std::string path);
    static TransferError destination_exists(std::string path);
    static TransferError permission_denied(std::string path, std::string message);
    static TransferError insufficient_space(std::uintmax_t required, std::uintmax_t available);
    static TransferError same_location(std::string path);
    static TransferError destination_inside_source(std::string source, std::string destination);
    static TransferError symlink_loop(std::string path);
    static TransferError io_error(std::string path, std::string message);
    static TransferError cancelled(std::string message);

    Kind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& destination() const noexcept { return destination_; }
    std::uintmax_t required() const noexcept { return required_; }
    std::uintmax_t available() const noexcept { return available_; }

    bool is_cancellation() const noexcept { return kind_ == Kind::Cancelled; }

    /**
     * @brief Returns the snake_case tag of the kind, e.g. "insufficient_space".
     */
    std::string type_tag() const;

    /**
     * @brief Localized, human-readable description for dialogs.
     */
    std::string user_message() const;

    /**
     * @brief Compact description with the tag and every field, for logs.
     */
    std::string describe() const;

    Json::Value to_json() const;
    static TransferError from_json(const Json::Value& value);

private:
    explicit TransferError(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string path_;
    std::string message_;
    std::string destination_;
    std::uintmax_t required_{0};
    std::uintmax_t available_{0};
};

std::string to_string(TransferError::Kind kind);

/**
 * @brief Carries a TransferError out of the worker call stack.
 *
 * Thrown by operation-fatal failures and caught at the task boundary, where the
 * carried value becomes the terminal event payload.
 */
class TransferFailure : public std::runtime_error {
public:
    explicit TransferFailure(TransferError error)
        : std::runtime_error(error.describe()),
          error_(std::move(error)) {}

    const TransferError& error() const noexcept { return error_; }

private:
    TransferError error_;
};

#define THROW_TRANSFER_ERROR(error) \
    throw TransferFailure(error)

#endif // TRANSFER_ERROR_HPP
