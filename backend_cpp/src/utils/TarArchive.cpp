#include "utils/TarArchive.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace data_agent {

namespace {

// Zero-padded octal, NUL terminated, filling exactly `width` bytes.
void put_octal(char* field, size_t width, uint64_t value) {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), static_cast<unsigned long long>(value));
}

// One pax "<len> key=value\n" record, where len counts the whole record.
std::string pax_record(const std::string& key, const std::string& value) {
    const size_t body = 1 + key.size() + 1 + value.size() + 1;
    size_t len = body + 1;
    while (std::to_string(len).size() + body != len) len = std::to_string(len).size() + body;
    return std::to_string(len) + " " + key + "=" + value + "\n";
}

}

void TarArchive::add_file(const std::string& name, const std::string& content, uint32_t mode) {
    if (finished_) throw std::logic_error("TarArchive: add_file after finish");
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw std::invalid_argument("TarArchive: invalid entry name '" + name + "'");
    }
    if (name.size() > kNameField) {
        // The extended header carries the full path; the ustar name field
        // keeps a truncated copy for readers that ignore pax.
        append_entry("././@PaxHeader", pax_record("path", name), 0644, 'x');
    }
    append_entry(name.substr(0, kNameField), content, mode, '0');
    ++entries_;
}

void TarArchive::append_entry(const std::string& name, const std::string& content, uint32_t mode, char type) {
    char header[kBlockSize];
    std::memset(header, 0, sizeof(header));

    std::memcpy(header, name.data(), name.size());             // name
    put_octal(header + 100, 8, mode);                           // mode
    put_octal(header + 108, 8, 0);                              // uid
    put_octal(header + 116, 8, 0);                              // gid
    put_octal(header + 124, 12, content.size());                // size
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    put_octal(header + 136, 12, static_cast<uint64_t>(now));    // mtime
    std::memset(header + 148, ' ', 8);                          // chksum placeholder
    header[156] = type;
    std::memcpy(header + 257, "ustar", 6);                      // magic incl. NUL
    std::memcpy(header + 263, "00", 2);                         // version
    std::memcpy(header + 265, "root", 4);                       // uname
    std::memcpy(header + 297, "root", 4);                       // gname

    unsigned int sum = 0;
    for (unsigned char c : header) sum += c;
    std::snprintf(header + 148, 7, "%06o", sum);
    header[154] = '\0';
    header[155] = ' ';

    data_.append(header, sizeof(header));
    data_.append(content);
    size_t pad = (kBlockSize - content.size() % kBlockSize) % kBlockSize;
    data_.append(pad, '\0');
}

std::string TarArchive::finish() {
    if (!finished_) {
        data_.append(2 * kBlockSize, '\0');
        finished_ = true;
    }
    return data_;
}

}
