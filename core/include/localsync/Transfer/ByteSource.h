// ByteSource.h — источник байтов "выдай следующий кусок"

#pragma once

#include "../export.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace LocalSync {

/// Записать до len байт в buf. Возвращает число записанных байт, 0 = конец потока.
/// Ошибка чтения: исключение.
using ByteSource = std::function<size_t(uint8_t* buf, size_t len)>;

/// Источник поверх буфера в памяти (буфер копируется/перемещается внутрь)
LS_API ByteSource makeMemorySource(std::string data);
LS_API ByteSource makeMemorySource(std::vector<uint8_t> data);

/// Источник поверх потока. Поток должен пережить источник.
/// @throws TransferFailed если поток перешёл в состояние bad()
LS_API ByteSource makeStreamSource(std::istream& stream);

} // namespace LocalSync
