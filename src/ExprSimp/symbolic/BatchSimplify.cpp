#include "../../../include/ExprSimp/symbolic/BatchSimplify.h"
#include <oneapi/tbb/parallel_for.h>
#include <oneapi/tbb/blocked_range.h>

namespace ExprSimp::Simplifier {

std::vector<ExprPtr> simplify_batch(const std::vector<ExprPtr>& inputs) {
    std::vector<ExprPtr> results(inputs.size());

    // 每个任务只写自己的槽位, 不需要加锁
    oneapi::tbb::parallel_for(oneapi::tbb::blocked_range<size_t>(0, inputs.size()),
        [&](const oneapi::tbb::blocked_range<size_t>& r) {
            for (size_t i = r.begin(); i != r.end(); ++i) {
                results[i] = simplify(inputs[i]);
            }
        });

    return results;
}

} // namespace ExprSimp::Simplifier
