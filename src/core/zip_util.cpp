#include "jdki/zip_util.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <vector>

namespace jdki {

namespace {

std::vector<std::string> splitEntryPath(const std::string& entryPath) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : entryPath) {
        if (c == '/' || c == '\\') {
            if (!current.empty() && current != ".") parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") parts.push_back(current);
    return parts;
}

// On failure, failed is set to whichever side reported it.
int copy_data(struct archive* ar, struct archive* aw, struct archive*& failed) {
    int r;
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) {
            failed = ar;
            return r;
        }
        r = archive_write_data_block(aw, buff, size, offset);
        if (r < ARCHIVE_OK) {
            failed = aw;
            return r;
        }
    }
}

std::string errorString(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

} // namespace

std::string ZipUtil::stripComponents(const std::string& entryPath, int stripLevels) {
    auto parts = splitEntryPath(entryPath);
    if (stripLevels < 0) stripLevels = 0;
    if (parts.size() <= static_cast<size_t>(stripLevels)) return "";

    std::string out;
    for (size_t i = static_cast<size_t>(stripLevels); i < parts.size(); ++i) {
        if (!out.empty()) out += '/';
        out += parts[i];
    }
    return out;
}

bool ZipUtil::hasParentReference(const std::string& entryPath) {
    for (const auto& part : splitEntryPath(entryPath)) {
        if (part == "..") return true;
    }
    return false;
}

void ZipUtil::extract(const std::string& archivePath, const std::string& destPath, int stripLevels) {
    const std::string context = archivePath + " into " + destPath;

    std::error_code ec;
    std::filesystem::path dest(destPath);
    if (!std::filesystem::is_directory(dest, ec)) {
        throw ExtractionError("Cannot extract " + context + ": destination is not a directory");
    }

    int flags = ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_ACL;
    flags |= ARCHIVE_EXTRACT_FFLAGS;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;

    struct archive* a = archive_read_new();
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    struct archive* ext = archive_write_disk_new();
    archive_write_disk_set_options(ext, flags);
    archive_write_disk_set_standard_lookup(ext);

    auto fail = [&](const std::string& reason) {
        std::string msg = "Failed to extract " + context + ": " + reason;
        archive_read_free(a);
        archive_write_free(ext);
        throw ExtractionError(msg);
    };

    if (archive_read_open_filename(a, archivePath.c_str(), 10240) != ARCHIVE_OK) {
        fail(errorString(a));
    }

    LOG_DEBUG("Extracting " + context + " (strip " + std::to_string(stripLevels) + ")");

    size_t written = 0;
    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive header warning: " + errorString(a));
        }
        if (r < ARCHIVE_WARN) {
            fail(errorString(a));
        }

        const char* currentFile = archive_entry_pathname(entry);
        std::string original = currentFile ? currentFile : "";

        if (hasParentReference(original)) {
            LOG_WARN("Skipping potentially unsafe entry: " + original);
            continue;
        }

        std::string relPath = stripComponents(original, stripLevels);
        if (relPath.empty()) continue;

        std::filesystem::path fullPath = dest / relPath;
        archive_entry_set_pathname(entry, fullPath.string().c_str());

        const char* link = archive_entry_hardlink(entry);
        if (link) {
            std::string linkTarget = stripComponents(link, stripLevels);
            if (linkTarget.empty() || hasParentReference(link)) {
                LOG_WARN("Skipping hardlink with unusable target: " + original);
                continue;
            }
            archive_entry_set_hardlink(entry, (dest / linkTarget).string().c_str());
        }

        r = archive_write_header(ext, entry);
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive write header warning: " + errorString(ext));
        }
        if (r < ARCHIVE_WARN) {
            fail("cannot write " + fullPath.string() + ": " + errorString(ext));
        }
        if (!archive_entry_size_is_set(entry) || archive_entry_size(entry) > 0) {
            struct archive* failed = nullptr;
            r = copy_data(a, ext, failed);
            if (r < ARCHIVE_OK) {
                LOG_WARN("Archive data copy warning: " + errorString(failed));
            }
            if (r < ARCHIVE_WARN) {
                const char* side = failed == a ? "cannot read data for " : "cannot write data for ";
                fail(side + fullPath.string() + ": " + errorString(failed));
            }
        }
        r = archive_write_finish_entry(ext);
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive finish entry warning: " + errorString(ext));
        }
        if (r < ARCHIVE_WARN) {
            fail("cannot finish " + fullPath.string() + ": " + errorString(ext));
        }
        ++written;
    }

    archive_read_close(a);
    archive_read_free(a);
    if (archive_write_close(ext) != ARCHIVE_OK) {
        std::string reason = errorString(ext);
        archive_write_free(ext);
        throw ExtractionError("Failed to extract " + context + ": " + reason);
    }
    archive_write_free(ext);

    LOG_INFO("Extracted " + std::to_string(written) + " entries from " + context);
}

} // namespace jdki
