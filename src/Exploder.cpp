#include "Exploder.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace {
void renamePath(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
    std::filesystem::rename(from, to, ec);
}

std::string withCause(std::string message, const std::error_code& ec) {
    return message + ": " + ec.message();
}
} // namespace

Exploder::Exploder(ExplodeConfig config, std::ostream& out)
    : m_config(std::move(config)), m_out(out), m_rename(renamePath) {
}

void Exploder::setRenameFunction(RenameFunction rename) {
    m_rename = rename ? std::move(rename) : RenameFunction(renamePath);
}

bool Exploder::explode() {
    if (!moveFiles()) {
        return false;
    }

    if (!removeSourceDirectory()) {
        return false;
    }

    m_out << "Exploded " << m_config.source.string() << " to " << m_config.destination.string() << std::endl;
    return true;
}

bool Exploder::moveFiles() {
    m_lastError = {};

    if (m_config.verbose) {
        m_out << "Moving files in `" << m_config.source.string() << "` -> `" << m_config.destination.string() << "`"
              << std::endl;
    }

    if (!checkPreconditions()) {
        return false;
    }

    std::vector<DirectoryEntry> entries;
    if (!listEntries(entries)) {
        return false;
    }

    for (const auto& entry : entries) {
        if (!transferEntry(entry)) {
            return false;
        }
    }

    return true;
}

bool Exploder::removeSourceDirectory() {
    m_lastError = {};

    if (m_config.verbose) {
        m_out << "Removing `" << m_config.source.string() << "`" << std::endl;
    }

    if (m_config.dryRun) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(m_config.source, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        return fail(ExplodeErrorKind::RemoveDirectoryFailed,
                    withCause("Failed to remove directory " + m_config.source.string(), ec), ec);
    }

    const bool removed = std::filesystem::remove(m_config.source, ec);
    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        return fail(ExplodeErrorKind::SourceNotEmpty,
                    withCause("Failed to remove directory " + m_config.source.string(), ec), ec);
    }
    if (!ec && !removed) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (ec) {
        return fail(ExplodeErrorKind::RemoveDirectoryFailed,
                    withCause("Failed to remove directory " + m_config.source.string(), ec), ec);
    }

    return true;
}

bool Exploder::checkPreconditions() {
    const auto& source = m_config.source;
    const auto& destination = m_config.destination;

    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        if (ec) {
            return fail(ExplodeErrorKind::ReadDirectoryFailed,
                        withCause("Failed to read directory " + source.string(), ec), ec);
        }
        return fail(ExplodeErrorKind::SourceNotFound, "Source path " + source.string() + " does not exist");
    }

    if (!std::filesystem::is_directory(source, ec)) {
        return fail(ExplodeErrorKind::SourceNotADirectory, "Source path " + source.string() + " is not a directory",
                    ec);
    }

    bool destinationExists = std::filesystem::exists(destination, ec);
    if (ec) {
        return fail(ExplodeErrorKind::CreateDirectoryFailed,
                    withCause("Failed to create destination dir " + destination.string(), ec), ec);
    }

    // Dry-run never touches the filesystem, so a missing destination simply stays missing.
    if (!destinationExists && !m_config.dryRun) {
        std::filesystem::create_directory(destination, ec);
        if (ec) {
            return fail(ExplodeErrorKind::CreateDirectoryFailed,
                        withCause("Failed to create destination dir " + destination.string(), ec), ec);
        }
        destinationExists = true;
    }

    if (destinationExists && !std::filesystem::is_directory(destination, ec)) {
        return fail(ExplodeErrorKind::DestinationNotADirectory,
                    "Target path " + destination.string() + " is not a directory", ec);
    }

    // Exploding a directory into itself would make every entry conflict with itself.
    if (destinationExists && std::filesystem::equivalent(source, destination, ec)) {
        return fail(ExplodeErrorKind::SameDirectory,
                    "Source path " + source.string() + " and target path " + destination.string() +
                        " are the same directory");
    }
    if (ec) {
        return fail(ExplodeErrorKind::ReadDirectoryFailed,
                    withCause("Failed to read directory " + destination.string(), ec), ec);
    }

    return true;
}

bool Exploder::listEntries(std::vector<DirectoryEntry>& entries) {
    const auto& source = m_config.source;

    std::error_code ec;
    std::filesystem::directory_iterator iter(source, ec);
    for (; !ec && iter != std::filesystem::directory_iterator(); iter.increment(ec)) {
        DirectoryEntry entry;
        entry.name = iter->path().filename().string();
        entry.sourcePath = std::filesystem::absolute(iter->path(), ec);
        if (ec) {
            break;
        }
        entry.destinationPath = m_config.destination / iter->path().filename();
        entries.push_back(std::move(entry));
    }

    if (ec) {
        return fail(ExplodeErrorKind::ReadDirectoryFailed, withCause("Failed to read directory " + source.string(), ec),
                    ec);
    }

    return true;
}

bool Exploder::transferEntry(const DirectoryEntry& entry) {
    const auto& from = entry.sourcePath;
    const auto& to = entry.destinationPath;
    const std::string context = "Failed to move or copy " + from.string() + " to " + to.string();

    std::error_code ec;
    const bool targetExists = std::filesystem::exists(to, ec);
    if (ec) {
        return fail(ExplodeErrorKind::TransferFailed, withCause(context, ec), ec);
    }

    if (targetExists && !m_config.force) {
        return fail(ExplodeErrorKind::AlreadyExists, std::string(describeEntry(from)) + " " + entry.name +
                                                         " already exists in " + m_config.destination.string());
    }

    if (m_config.verbose) {
        m_out << "Moving `" << from.string() << "` -> `" << to.string() << "`" << std::endl;
    }

    if (m_config.dryRun) {
        return true;
    }

    if (targetExists) {
        // Never clear a "conflict" that is the entry being moved, e.g. reached through a symlinked directory.
        // A source that does not resolve (dangling link) cannot be the same object, so its error is not fatal.
        std::error_code sameErr;
        if (std::filesystem::equivalent(from, to, sameErr)) {
            return fail(ExplodeErrorKind::TransferFailed, context + ": source and destination are the same entry",
                        std::make_error_code(std::errc::file_exists));
        }
        clearConflict(from, to, ec);
        if (ec) {
            return fail(ExplodeErrorKind::TransferFailed, withCause(context, ec), ec);
        }
    }

    moveOrCopy(from, to, ec);
    if (ec) {
        return fail(ExplodeErrorKind::TransferFailed, withCause(context, ec), ec);
    }

    return true;
}

void Exploder::moveOrCopy(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) {
    m_rename(from, to, ec);
    if (ec != std::errc::cross_device_link) {
        return;
    }
    ec.clear();

    if (m_config.verbose) {
        m_out << "Copying `" << from.string() << "` -> `" << to.string() << "` (cross-device move)" << std::endl;
    }

    const auto status = std::filesystem::symlink_status(from, ec);
    if (ec) {
        return;
    }

    if (std::filesystem::is_symlink(status)) {
        std::filesystem::copy_symlink(from, to, ec);
        if (!ec) {
            std::filesystem::remove(from, ec);
        }
        return;
    }

    if (std::filesystem::is_directory(status)) {
        auto options = std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks;
        if (m_config.force) {
            options |= std::filesystem::copy_options::overwrite_existing;
        }

        std::filesystem::create_directory(to, ec);
        if (ec) {
            return;
        }
        std::filesystem::copy(from, to, options, ec);
        if (ec) {
            return;
        }
        // Copy finished; the original tree must not outlive it in the source root.
        std::filesystem::remove_all(from, ec);
        return;
    }

    const auto options = m_config.force ? std::filesystem::copy_options::overwrite_existing
                                        : std::filesystem::copy_options::none;
    std::filesystem::copy_file(from, to, options, ec);
    if (ec) {
        return;
    }
    std::filesystem::remove(from, ec);
}

void Exploder::clearConflict(const std::filesystem::path& from, const std::filesystem::path& to,
                             std::error_code& ec) const {
    // rename() already replaces a regular file atomically; anything involving a directory needs the target gone.
    const bool fromIsFile = std::filesystem::is_regular_file(from, ec);
    if (ec) {
        return;
    }
    const bool toIsFile = std::filesystem::is_regular_file(to, ec);
    if (ec) {
        return;
    }

    if (fromIsFile && toIsFile) {
        return;
    }

    std::filesystem::remove_all(to, ec);
}

bool Exploder::fail(ExplodeErrorKind kind, std::string message, std::error_code cause) {
    m_lastError.kind = kind;
    m_lastError.message = std::move(message);
    m_lastError.cause = cause;
    return false;
}

const char* Exploder::describeEntry(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return "Dir";
    }
    if (std::filesystem::is_regular_file(path, ec)) {
        return "File";
    }
    return "Entry";
}
