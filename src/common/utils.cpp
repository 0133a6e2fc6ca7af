#include "common/utils.hpp"
#include <stdlib.h>
using namespace std;

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}
