// EncodingSelector.h — выбор наименьшего варианта кодирования изображения
// Само кодирование выполняет внешний кодек

#pragma once

#include "../export.h"
#include "../Models.h"
#include <vector>

namespace LocalSync {

/// Вернуть кандидата со строго меньшим размером в байтах, чем у всех
/// предыдущих и у оригинала. При равенстве выигрывает более ранний вариант,
/// если ни один кандидат не меньше: возвращается оригинал.
LS_API EncodedImage selectSmallestEncoding(
    EncodedImage original,
    std::vector<EncodedImage> candidates);

} // namespace LocalSync
