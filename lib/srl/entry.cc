#include "srl/entry.hh"

#include <cctype>

namespace srl {

static bool ends_with_bin(std::string_view p) {
    static const char suffix[] = ".bin";
    const size_t len = sizeof(suffix) - 1;
    if (p.size() < len)
        return false;

    for (size_t i = 0; i < len; ++i) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(p[p.size() - len + i])));
        if (c != suffix[i])
            return false;
    }

    return true;
}

std::string normalize_path(std::string_view path) {
    while (path.starts_with('/'))
        path.remove_prefix(1);

    // An entry could in principle be named "x.bin"; pass normalize = false to
    // resolve to reach it.
    while (ends_with_bin(path))
        path.remove_suffix(4);

    return std::string(path);
}

Error EntryTable::resolve(
        const std::string& path,
        const Entry** entry,
        bool normalize) const {
    std::string name = normalize ? normalize_path(path) : path;

    auto it = entries.find(name);
    if (it == entries.end())
        return error_new(Error::NOTFOUND)
            << "no entry named \"" << name.c_str() << "\"";

    *entry = &it->second;
    return Error();
}

}
