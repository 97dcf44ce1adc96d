#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Error is a stack of frames describing a failure. The first frame is the
// root cause; every CHECK that propagates the error pushes another frame with
// its own kind and context message. A default constructed Error is "no error".
struct Error {
    enum Kind {
        NONE,
        BADREAD,
        INVALIDOFFSET,
        INVALIDUSAGE,
        OPENFAILED,
        CLOSEFAILED,
        NOTFOUND,
        MALFORMEDICON,
        UNKNOWNFORMAT,
        DECOMPRESSIONFAILED,
        RECONSTRUCTFAILED,
    };

    struct Frame {
        Kind kind;
        const char* file;
        size_t line;
        std::wstringstream message;

        Frame(Kind kind,
                const char* file,
                size_t line):
            kind(kind), file(file), line(line) {}

        Frame(const Frame& rhs):
            kind(rhs.kind), file(rhs.file), line(rhs.line), message(rhs.message.str()) {}
    };

    std::vector<Frame> frames;

    template <typename T>
        Error& operator<<(T t) {
            frames.back().message << t;
            return *this;
        }

    Error(
            Kind kind,
            const char* file,
            size_t line): frames() {
        push(kind, file, line);
    }

    Error(): frames() {}

    Error& push(
            Kind kind,
            const char* file,
            size_t line) {
        frames.emplace_back(kind, file, line);
        return *this;
    }

    // kind returns the kind of the root cause, or NONE.
    Kind kind() const {
        if (frames.empty())
            return NONE;

        return frames.front().kind;
    }

    // is returns whether any frame of this error has kind k.
    bool is(Kind k) const {
        for (const Frame& f : frames) {
            if (f.kind == k)
                return true;
        }

        return false;
    }

    explicit operator bool() const {
        return frames.size() > 0;
    }

    void print(std::wostream& os) const {
        if (frames.size() == 0) {
            os << "no error";
        }

        for (size_t i = 0, l = frames.size(); i < l; ++i) {
            const Frame& f = frames[i];
            os << f.file << ":" << f.line << ": "
               << kind_str(f.kind) << ": " << f.message.str() << "\n";
        }
    }

    std::wstring str() const {
        std::wstringstream ss;
        print(ss);
        return ss.str();
    }

    static const char* kind_str(Kind k) {
        switch (k) {
        case NONE:
            return "NONE";
        case BADREAD:
            return "BADREAD";
        case INVALIDOFFSET:
            return "INVALIDOFFSET";
        case INVALIDUSAGE:
            return "INVALIDUSAGE";
        case OPENFAILED:
            return "OPENFAILED";
        case CLOSEFAILED:
            return "CLOSEFAILED";
        case NOTFOUND:
            return "NOTFOUND";
        case MALFORMEDICON:
            return "MALFORMEDICON";
        case UNKNOWNFORMAT:
            return "UNKNOWNFORMAT";
        case DECOMPRESSIONFAILED:
            return "DECOMPRESSIONFAILED";
        case RECONSTRUCTFAILED:
            return "RECONSTRUCTFAILED";
        }

        return "??";
    }
};

inline std::wostream& operator<<(std::wostream& os, const Error& e) {
    e.print(os);
    return os;
}

#define error_push(e, k) \
    e.push(k, __FILE__, __LINE__)

#define error_new(k) \
    Error(k, __FILE__, __LINE__)

#define CHECK(x, k) \
    if (Error __error__ = (x)) return error_push(__error__, k)
