#include "TransferError.hpp"
#include "ErrorMessages.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

TransferError TransferError::source_not_found(std::string path)
{
    TransferError error(Kind::SourceNotFound);
    error.path_ = std::move(path);
    return error;
}

TransferError TransferError::destination_exists(std::string path)
{
    TransferError error(Kind::DestinationExists);
    error.path_ = std::move(path);
    return error;
}

TransferError TransferError::permission_denied(std::string path, std::string message)
{
    TransferError error(Kind::PermissionDenied);
    error.path_ = std::move(path);
    error.message_ = std::move(message);
    return error;
}

TransferError TransferError::insufficient_space(std::uintmax_t required, std::uintmax_t available)
{
    TransferError error(Kind::InsufficientSpace);
    error.required_ = required;
    error.available_ = available;
    return error;
}

TransferError TransferError::same_location(std::string path)
{
    TransferError error(Kind::SameLocation);
    error.path_ = std::move(path);
    return error;
}

TransferError TransferError::destination_inside_source(std::string source, std::string destination)
{
    TransferError error(Kind::DestinationInsideSource);
    error.path_ = std::move(source);
    error.destination_ = std::move(destination);
    return error;
}

TransferError TransferError::symlink_loop(std::string path)
{
    TransferError error(Kind::SymlinkLoop);
    error.path_ = std::move(path);
    return error;
}

TransferError TransferError::io_error(std::string path, std::string message)
{
    TransferError error(Kind::IoError);
    error.path_ = std::move(path);
    error.message_ = std::move(message);
    return error;
}

TransferError TransferError::cancelled(std::string message)
{
    TransferError error(Kind::Cancelled);
    error.message_ = std::move(message);
    return error;
}

std::string to_string(TransferError::Kind kind)
{
    switch (kind) {
        case TransferError::Kind::SourceNotFound: return "source_not_found";
        case TransferError::Kind::DestinationExists: return "destination_exists";
        case TransferError::Kind::PermissionDenied: return "permission_denied";
        case TransferError::Kind::InsufficientSpace: return "insufficient_space";
        case TransferError::Kind::SameLocation: return "same_location";
        case TransferError::Kind::DestinationInsideSource: return "destination_inside_source";
        case TransferError::Kind::SymlinkLoop: return "symlink_loop";
        case TransferError::Kind::IoError: return "io_error";
        case TransferError::Kind::Cancelled: return "cancelled";
        default: return "io_error";
    }
}

std::string TransferError::type_tag() const
{
    return to_string(kind_);
}

std::string TransferError::user_message() const
{
    switch (kind_) {
        case Kind::SourceNotFound:
            return fmt::format(fmt::runtime(ERR_SOURCE_NOT_FOUND), path_);
        case Kind::DestinationExists:
            return fmt::format(fmt::runtime(ERR_DESTINATION_EXISTS), Utils::file_name_of(path_));
        case Kind::PermissionDenied:
            return fmt::format(fmt::runtime(ERR_PERMISSION_DENIED), path_);
        case Kind::InsufficientSpace:
            return fmt::format(fmt::runtime(ERR_INSUFFICIENT_SPACE),
                               Utils::format_bytes(required_),
                               Utils::format_bytes(available_));
        case Kind::SameLocation:
            return fmt::format(fmt::runtime(ERR_SAME_LOCATION), path_);
        case Kind::DestinationInsideSource:
            return fmt::format(fmt::runtime(ERR_DESTINATION_INSIDE_SOURCE), path_);
        case Kind::SymlinkLoop:
            return fmt::format(fmt::runtime(ERR_SYMLINK_LOOP), path_);
        case Kind::IoError:
            if (path_.empty()) {
                return fmt::format(fmt::runtime(ERR_IO_GENERIC), message_);
            }
            return fmt::format(fmt::runtime(ERR_IO_WITH_PATH), path_, message_);
        case Kind::Cancelled:
            return ERR_CANCELLED;
    }
    return fmt::format(fmt::runtime(ERR_IO_GENERIC), message_);
}

std::string TransferError::describe() const
{
    switch (kind_) {
        case Kind::InsufficientSpace:
            return fmt::format("{}{{required={}, available={}}}", type_tag(), required_, available_);
        case Kind::DestinationInsideSource:
            return fmt::format("{}{{source='{}', destination='{}'}}", type_tag(), path_, destination_);
        case Kind::PermissionDenied:
        case Kind::IoError:
            return fmt::format("{}{{path='{}', message='{}'}}", type_tag(), path_, message_);
        case Kind::Cancelled:
            return fmt::format("{}{{message='{}'}}", type_tag(), message_);
        default:
            return fmt::format("{}{{path='{}'}}", type_tag(), path_);
    }
}

Json::Value TransferError::to_json() const
{
    Json::Value value(Json::objectValue);
    value["type"] = type_tag();
    switch (kind_) {
        case Kind::InsufficientSpace:
            value["required"] = Json::UInt64(required_);
            value["available"] = Json::UInt64(available_);
            break;
        case Kind::DestinationInsideSource:
            value["source"] = path_;
            value["destination"] = destination_;
            break;
        case Kind::PermissionDenied:
        case Kind::IoError:
            value["path"] = path_;
            value["message"] = message_;
            break;
        case Kind::Cancelled:
            value["message"] = message_;
            break;
        default:
            value["path"] = path_;
            break;
    }
    return value;
}

TransferError TransferError::from_json(const Json::Value& value)
{
    const std::string type = value.get("type", "io_error").asString();
    const std::string path = value.get("path", "").asString();
    const std::string message = value.get("message", "").asString();

    if (type == "source_not_found") return source_not_found(path);
    if (type == "destination_exists") return destination_exists(path);
    if (type == "permission_denied") return permission_denied(path, message);
    if (type == "insufficient_space") {
        return insufficient_space(value.get("required", 0).asUInt64(),
                                  value.get("available", 0).asUInt64());
    }
    if (type == "same_location") return same_location(path);
    if (type == "destination_inside_source") {
        return destination_inside_source(value.get("source", "").asString(),
                                         value.get("destination", "").asString());
    }
    if (type == "symlink_loop") return symlink_loop(path);
    if (type == "cancelled") return cancelled(message);
    return io_error(path, message);
}
