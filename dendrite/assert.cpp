#include <cstdlib>
#include <iostream>

#include <dendrite/assert.hpp>

namespace dend {

void abort_on_failed_assertion(
    const char* assertion,
    const char* file,
    int line,
    const char* func)
{
    // Explicit flush, as we can't assume default buffering semantics on stderr/cerr,
    // and abort() might not flush streams.
    std::cerr << file << ':' << line << " " << func
              << ": Assertion `" << assertion << "' failed." << std::endl;
    std::abort();
}

failed_assertion_handler_t global_failed_assertion_handler = abort_on_failed_assertion;

} // namespace dend
