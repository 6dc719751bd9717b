//=============================================================================
// ydispatch Unit Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    // Suites register themselves during static initialization and run
    // when the runner is torn down
}
