/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Tar.hpp"

#include <fstream>
#include <memory>

#include <boost/format.hpp>
#include <archive.h> // libarchive
#include <archive_entry.h> // libarchive

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"


namespace ocmirror {
namespace archive {
namespace tar {

using ReadHandle = std::unique_ptr<::archive, decltype(&archive_read_free)>;
using WriteHandle = std::unique_ptr<::archive, decltype(&archive_write_free)>;
using EntryHandle = std::unique_ptr<::archive_entry, decltype(&archive_entry_free)>;

static void log(const boost::format& message, libocmirror::LogLevel level) {
    libocmirror::Logger::getInstance().log(message, "Tar", level);
}

static void writeDataOfFile(const boost::filesystem::path& archivePath,
                            ::archive* out,
                            ::archive_entry* entry) {
    auto sourcePath = boost::filesystem::path{archive_entry_sourcepath(entry)};
    std::ifstream in{sourcePath.string(), std::ios::binary};
    if(!in) {
        auto message = boost::format("Failed to open %s to add it to archive %s") % sourcePath % archivePath;
        OCMIRROR_THROW_ERROR(message.str());
    }

    char buffer[65536];
    while(in) {
        in.read(buffer, sizeof(buffer));
        auto size = in.gcount();
        if(size > 0 && archive_write_data(out, buffer, size) < 0) {
            auto message = boost::format("Failed to write data of %s into archive %s: %s")
                % sourcePath % archivePath % archive_error_string(out);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
    if(in.bad()) {
        auto message = boost::format("Failed to read %s to add it to archive %s") % sourcePath % archivePath;
        OCMIRROR_THROW_ERROR(message.str());
    }
}

static void addTree(const common::Context& context,
                    const boost::filesystem::path& archivePath,
                    ::archive* out,
                    const Entry& tree) {
    auto root = (tree.parentDirectory / tree.name).string();
    log(boost::format("archive: adding %s as %s") % root % tree.name, libocmirror::LogLevel::DEBUG);

    auto disk = ReadHandle{archive_read_disk_new(), archive_read_free};
    archive_read_disk_set_symlink_physical(disk.get());
    archive_read_disk_set_standard_lookup(disk.get());
    if(archive_read_disk_open(disk.get(), root.c_str()) != ARCHIVE_OK) {
        auto message = boost::format("Failed to open %s to add it to archive %s: %s")
            % root % archivePath % archive_error_string(disk.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    while(true) {
        context.throwIfCancelled("archive creation");

        auto entry = EntryHandle{archive_entry_new(), archive_entry_free};
        int r = archive_read_next_header2(disk.get(), entry.get());
        if(r == ARCHIVE_EOF) {
            break;
        }
        else if(r < ARCHIVE_WARN) {
            auto message = boost::format("Failed to read %s to add it to archive %s: %s")
                % root % archivePath % archive_error_string(disk.get());
            OCMIRROR_THROW_ERROR(message.str());
        }
        else if(r < ARCHIVE_OK) {
            log(boost::format("archive: warning while reading %s (%s)")
                % archive_entry_sourcepath(entry.get()) % archive_error_string(disk.get()),
                libocmirror::LogLevel::INFO);
        }
        archive_read_disk_descend(disk.get());

        // pathnames are stored relative to the parent directory
        auto pathname = tree.name + libocmirror::string::removePrefix(archive_entry_pathname(entry.get()), root);
        archive_entry_set_pathname(entry.get(), pathname.c_str());

        r = archive_write_header(out, entry.get());
        if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive %s: error while writing header of entry %s (%s)")
                % archivePath % pathname % archive_error_string(out);
            OCMIRROR_THROW_ERROR(message.str());
        }
        if(archive_entry_filetype(entry.get()) == AE_IFREG && archive_entry_size(entry.get()) > 0) {
            writeDataOfFile(archivePath, out, entry.get());
        }
    }
}

void create(const common::Context& context,
            const boost::filesystem::path& archivePath,
            const std::vector<Entry>& entries) {
    log(boost::format("creating archive %s") % archivePath, libocmirror::LogLevel::DEBUG);

    auto out = WriteHandle{archive_write_new(), archive_write_free};
    archive_write_set_format_pax_restricted(out.get());
    if(archive_write_open_filename(out.get(), archivePath.string().c_str()) != ARCHIVE_OK) {
        auto message = boost::format("failed to open archive %s for writing (%s)")
            % archivePath % archive_error_string(out.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    for(const auto& tree : entries) {
        addTree(context, archivePath, out.get(), tree);
    }

    if(archive_write_close(out.get()) != ARCHIVE_OK) {
        auto message = boost::format("failed to finalize archive %s (%s)")
            % archivePath % archive_error_string(out.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    log(boost::format("successfully created archive %s") % archivePath, libocmirror::LogLevel::DEBUG);
}

static void copyDataOfArchiveEntry(const boost::filesystem::path& archivePath,
                                   ::archive* in,
                                   ::archive* out,
                                   ::archive_entry* entry) {
    int r;
    const void* buff;
    size_t size;
    la_int64_t offset;

    while(true) {
        r = archive_read_data_block(in, &buff, &size, &offset);
        if(r == ARCHIVE_EOF) {
            return;
        }
        else if(r < ARCHIVE_OK) {
            break;
        }

        r = archive_write_data_block(out, buff, size, offset);
        if(r < ARCHIVE_OK) {
            break;
        }
    }

    auto message = boost::format("Failed to copy data from archive %s. Error while copying entry %s: %s")
        % archivePath % archive_entry_pathname(entry) % archive_error_string(in);
    if(r < ARCHIVE_WARN) {
        OCMIRROR_THROW_ERROR(message.str());
    }
    log(message, libocmirror::LogLevel::INFO);
}

// Entries are written relative to the extraction directory and must stay below it
static bool isContainedEntryPath(const boost::filesystem::path& entryPath) {
    if(entryPath.empty() || entryPath.has_root_path()) {
        return false;
    }
    for(const auto& component : entryPath) {
        if(component == "..") {
            return false;
        }
    }
    return true;
}

static void extractEntries(const common::Context& context,
                           const boost::filesystem::path& archivePath,
                           ::archive* in,
                           ::archive* out) {
    while(true) {
        context.throwIfCancelled("archive extraction");

        ::archive_entry* entry;
        int r = archive_read_next_header(in, &entry);
        if(r == ARCHIVE_EOF) {
            break;
        }
        else if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive %s: error while reading entry header (%s)")
                % archivePath % archive_error_string(in);
            OCMIRROR_THROW_ERROR(message.str());
        }
        else if(r < ARCHIVE_OK) {
            // the data of the entry might still be readable, a failure is reported while copying it
            log(boost::format("archive: error while reading header of entry %s (%s)")
                % archive_entry_pathname(entry) % archive_error_string(in),
                libocmirror::LogLevel::INFO);
        }

        auto archiveEntryPath = boost::filesystem::path(archive_entry_pathname(entry));
        if(!isContainedEntryPath(archiveEntryPath)) {
            auto message = boost::format("archive %s: refusing to extract entry %s outside of the extraction directory")
                % archivePath % archiveEntryPath;
            OCMIRROR_THROW_ERROR(message.str());
        }

        r = archive_write_header(out, entry);
        if(r < ARCHIVE_OK) {
            auto message = boost::format("archive %s: error while writing header of entry %s (%s)")
                % archivePath % archiveEntryPath % archive_error_string(out);
            OCMIRROR_THROW_ERROR(message.str());
        }
        else if(archive_entry_size(entry) > 0) {
            copyDataOfArchiveEntry(archivePath, in, out, entry);
        }

        r = archive_write_finish_entry(out);
        if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive %s: error while finishing to write entry %s (%s)")
                % archivePath % archiveEntryPath % archive_error_string(out);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
}

void extract(const common::Context& context,
             const boost::filesystem::path& archivePath,
             const boost::filesystem::path& expandDir) {
    log(boost::format("extracting archive %s into %s") % archivePath % expandDir, libocmirror::LogLevel::DEBUG);

    int flags = ARCHIVE_EXTRACT_TIME
                | ARCHIVE_EXTRACT_PERM
                | ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS
                | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                | ARCHIVE_EXTRACT_SECURE_SYMLINKS;

    auto in = ReadHandle{archive_read_new(), archive_read_free};
    archive_read_support_format_tar(in.get());

    auto out = WriteHandle{archive_write_disk_new(), archive_write_free};
    archive_write_disk_set_options(out.get(), flags);
    archive_write_disk_set_standard_lookup(out.get());

    if(archive_read_open_filename(in.get(), archivePath.string().c_str(), 10240) != ARCHIVE_OK) {
        auto message = boost::format("failed to open archive %s (%s)") % archivePath % archive_error_string(in.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    // entries are written relative to the current working directory
    auto cwd = boost::filesystem::current_path();
    libocmirror::filesystem::changeDirectory(expandDir);
    try {
        extractEntries(context, archivePath, in.get(), out.get());
    }
    catch(const std::exception& e) {
        auto ec = boost::system::error_code{};
        boost::filesystem::current_path(cwd, ec);
        if(ec) {
            log(boost::format("failed to move back to %s: %s") % cwd % ec.message(), libocmirror::LogLevel::WARN);
        }
        auto message = boost::format("Failed to extract archive %s") % archivePath;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
    libocmirror::filesystem::changeDirectory(cwd);

    if(archive_write_close(out.get()) != ARCHIVE_OK) {
        auto message = boost::format("failed to finalize extraction of archive %s (%s)")
            % archivePath % archive_error_string(out.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    log(boost::format("successfully extracted archive %s") % archivePath, libocmirror::LogLevel::DEBUG);
}

std::vector<std::string> listEntries(const boost::filesystem::path& archivePath) {
    auto in = ReadHandle{archive_read_new(), archive_read_free};
    archive_read_support_format_tar(in.get());
    if(archive_read_open_filename(in.get(), archivePath.string().c_str(), 10240) != ARCHIVE_OK) {
        auto message = boost::format("failed to open archive %s (%s)") % archivePath % archive_error_string(in.get());
        OCMIRROR_THROW_ERROR(message.str());
    }

    auto entries = std::vector<std::string>{};
    while(true) {
        ::archive_entry* entry;
        int r = archive_read_next_header(in.get(), &entry);
        if(r == ARCHIVE_EOF) {
            break;
        }
        else if(r < ARCHIVE_WARN) {
            auto message = boost::format("archive %s: error while reading entry header (%s)")
                % archivePath % archive_error_string(in.get());
            OCMIRROR_THROW_ERROR(message.str());
        }
        entries.push_back(archive_entry_pathname(entry));
        archive_read_data_skip(in.get());
    }
    return entries;
}

}
}
}
