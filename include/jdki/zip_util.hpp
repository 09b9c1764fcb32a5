#ifndef JDKI_ZIP_UTIL_HPP
#define JDKI_ZIP_UTIL_HPP

#include <string>

namespace jdki {

class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    // Unpacks archivePath into destPath, dropping the first stripLevels
    // components of every entry path. destPath must already exist.
    // Throws ExtractionError.
    virtual void extract(const std::string& archivePath, const std::string& destPath,
                         int stripLevels) = 0;
};

// libarchive-backed extractor; handles zip and the tar family.
class ZipUtil : public ArchiveExtractor {
public:
    void extract(const std::string& archivePath, const std::string& destPath,
                 int stripLevels) override;

    // Returns the entry path with the first stripLevels components removed,
    // or an empty string when nothing remains. Both '/' and '\' separate.
    static std::string stripComponents(const std::string& entryPath, int stripLevels);

    static bool hasParentReference(const std::string& entryPath);
};

} // namespace jdki

#endif // JDKI_ZIP_UTIL_HPP
