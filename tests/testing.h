#ifndef TESTING_H
#define TESTING_H

#include <iostream>

// number of failed checks in this test executable
inline int testing_failures = 0;

// If macro argument is not true, test is failing
#define IS_TRUE(x) { \
    if (!(x)) { \
        ++testing_failures; \
        std::cout << __PRETTY_FUNCTION__ << " failed on line " << __LINE__ << std::endl;\
    } else { \
        std::cout << __PRETTY_FUNCTION__ << " passed on line " << __LINE__ << std::endl;\
    } \
}

// If the statement does not throw an exception of the given type, test is failing
#define IS_THROWN(stmt, exception_type) { \
    bool thrown_ = false; \
    try { stmt; } catch (const exception_type &) { thrown_ = true; } \
    IS_TRUE(thrown_); \
}

// exit status for main(): 0 if every check passed
inline int test_result() {
    std::cout << (testing_failures == 0 ? "all checks passed" : "checks failed: ") ;
    if (testing_failures != 0) { std::cout << testing_failures; }
    std::cout << std::endl;
    return testing_failures == 0 ? 0 : 1;
}

#endif // TESTING_H
