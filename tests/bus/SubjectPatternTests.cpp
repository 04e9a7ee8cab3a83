#include <mudcast/bus/SubjectPattern.hpp>

#include <iostream>

using mudcast::bus::isValidPattern;
using mudcast::bus::isValidSubject;
using mudcast::bus::subjectMatches;

namespace {

bool test_valid_subjects() {
    if (!isValidSubject("global") || !isValidSubject("room.zone.sub")) {
        std::cerr << "[subject] valid subject rejected\n";
        return false;
    }
    for (const char *bad : {"", ".a", "a.", "a..b", "a b", "room.*", "room.>"}) {
        if (isValidSubject(bad)) {
            std::cerr << "[subject] accepted '" << bad << "'\n";
            return false;
        }
    }
    return true;
}

bool test_valid_patterns() {
    if (!isValidPattern("room.*.*") || !isValidPattern("room.>") || !isValidPattern(">")) {
        std::cerr << "[pattern] valid pattern rejected\n";
        return false;
    }
    for (const char *bad : {"", "room.>.x", "a..b", "room. x"}) {
        if (isValidPattern(bad)) {
            std::cerr << "[pattern] accepted '" << bad << "'\n";
            return false;
        }
    }
    return true;
}

bool test_matching() {
    struct Case {
        const char *pattern;
        const char *subject;
        bool expected;
    };
    const Case cases[] = {
        {"room.zone.sub", "room.zone.sub", true},
        {"room.zone.sub", "room.zone.other", false},
        {"room.*.sub", "room.zone.sub", true},
        {"room.*", "room.zone.sub", false},
        {"room.>", "room.zone.sub", true},
        {"room.>", "room", false},
        {">", "global", true},
        {"global", "system", false},
    };

    for (const auto &c : cases) {
        if (subjectMatches(c.pattern, c.subject) != c.expected) {
            std::cerr << "[match] pattern=" << c.pattern << " subject=" << c.subject << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_valid_subjects();
    ok = ok && test_valid_patterns();
    ok = ok && test_matching();

    if (!ok) {
        std::cerr << "SubjectPattern tests FAILED\n";
        return 1;
    }

    std::cout << "SubjectPattern tests PASSED\n";
    return 0;
}
