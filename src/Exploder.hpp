#ifndef EXPLODER_HPP
#define EXPLODER_HPP

#include "ExplodeConfig.hpp"

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

enum class ExplodeErrorKind {
    None,
    SourceNotFound,
    SourceNotADirectory,
    DestinationNotADirectory,
    SameDirectory,
    AlreadyExists,
    CreateDirectoryFailed,
    ReadDirectoryFailed,
    TransferFailed,
    SourceNotEmpty,
    RemoveDirectoryFailed
};

// Describes why the last operation stopped; cause is empty for precondition and conflict errors.
struct ExplodeError {
    ExplodeErrorKind kind = ExplodeErrorKind::None;
    std::string message;
    std::error_code cause;
};

// One direct child of the source directory and where it will end up.
struct DirectoryEntry {
    std::string name;
    std::filesystem::path sourcePath;
    std::filesystem::path destinationPath;
};

// Moves every direct child of the source directory into the destination, then removes the source.
class Exploder {
public:
    using RenameFunction =
        std::function<void(const std::filesystem::path&, const std::filesystem::path&, std::error_code&)>;

    // Progress lines and the final summary are written to `out`.
    Exploder(ExplodeConfig config, std::ostream& out);

    // Move all entries and remove the source; stops at the first failure and keeps the source.
    bool explode();
    // Check preconditions, create the destination if needed and transfer each entry in listing order.
    bool moveFiles();
    // Remove the (now empty) source directory. Does nothing in dry-run mode.
    bool removeSourceDirectory();

    // Replace the rename primitive used for each transfer.
    void setRenameFunction(RenameFunction rename);

    // Details of the most recent failure; kind is None after a successful call.
    const ExplodeError& lastError() const { return m_lastError; }

private:
    bool checkPreconditions();
    bool listEntries(std::vector<DirectoryEntry>& entries);
    bool transferEntry(const DirectoryEntry& entry);
    // Rename, falling back to copy + remove when the rename crosses devices.
    void moveOrCopy(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec);
    // Remove a conflicting destination entry that a plain rename cannot replace.
    void clearConflict(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) const;
    bool fail(ExplodeErrorKind kind, std::string message, std::error_code cause = {});

    // "Dir", "File" or "Entry", used in conflict messages.
    static const char* describeEntry(const std::filesystem::path& path);

    ExplodeConfig m_config;
    std::ostream& m_out;
    RenameFunction m_rename;
    ExplodeError m_lastError;
};

#endif
