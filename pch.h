#ifndef EXPRSIMP_PCH_H
#define EXPRSIMP_PCH_H
#define NOMINMAX
#include "simdjson.h"       // 引入 simdjson: 解析 JSON 形式的表达式
#include <nlohmann/json.hpp> // 保留: 用于序列化
// 标准库
#include <iostream>
#include <vector>

#include <string>
#include <string_view>
#include <sstream>
#include <memory>
#include <stdexcept>
#include <optional>
#include <limits>
#include <utility>
#include <algorithm>
#include <cstdint>
#include <cstddef>

// 第三方库
#include "oneapi/tbb/global_control.h"
#include <oneapi/tbb/parallel_for.h>
#include <oneapi/tbb/blocked_range.h>

#endif //EXPRSIMP_PCH_H
