//=============================================================================
// YView Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves through static initialization
    return boost::ut::cfg<>.run();
}
