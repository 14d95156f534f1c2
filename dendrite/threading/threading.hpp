#pragma once

#include <tbb/parallel_for.h>

namespace dend {
namespace threading {

// Loops with fewer than two iterations run inline.
struct parallel_for {
    template <typename F>
    static void apply(int left, int right, F f) {
        if (right-left<2) {
            for (int i=left; i<right; ++i) {
                f(i);
            }
            return;
        }
        ::tbb::parallel_for(left, right, f);
    }
};

} // namespace threading
} // namespace dend
