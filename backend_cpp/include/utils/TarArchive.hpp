#pragma once
#include <cstdint>
#include <string>

namespace data_agent {

// In-memory POSIX ustar writer. Only flat regular-file entries are needed:
// everything injected into a sandbox unit lands in one directory. Names
// past the 100 byte ustar field get a pax extended header.
class TarArchive {
public:
    static constexpr size_t kBlockSize = 512;
    static constexpr size_t kNameField = 100;

    // Throws std::invalid_argument for empty names or names containing '/'.
    void add_file(const std::string& name, const std::string& content, uint32_t mode = 0644);

    // Appends the two zero end-of-archive blocks and returns the stream.
    // The archive must not be extended afterwards.
    std::string finish();

    size_t entry_count() const { return entries_; }

private:
    void append_entry(const std::string& name, const std::string& content, uint32_t mode, char type);

    std::string data_;
    size_t entries_ = 0;
    bool finished_ = false;
};

}
