// ProgressReader.h — адаптер над ByteSource: отмена + прореженный прогресс
// Слой не знает о транспорте, транспорт не знает об отмене

#pragma once

#include "../export.h"
#include "../Models.h"
#include "ByteSource.h"
#include "CancellationRegistry.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace LocalSync {

/// Получатель событий прогресса. Исключения получателя не прерывают передачу.
using ProgressSink = std::function<void(const UploadProgress&)>;

class LS_API ProgressReader {
public:
    /// @param flag флаг отмены (читается, но не принадлежит reader'у); может быть nullptr
    /// @param total объявленный размер источника в байтах
    /// @param emitEvery порог прореживания в байтах; 0 = событие на каждый chunk
    ProgressReader(
        ByteSource source,
        std::shared_ptr<CancellationFlag> flag,
        std::string uploadId,
        uint64_t total,
        size_t emitEvery,
        ProgressSink sink);

    /// Одна попытка чтения:
    /// 1. флаг отмены проверяется до чтения (в том числе до первого байта);
    /// 2. чтение из источника;
    /// 3. на конце потока: финальное событие done=true, если его ещё не было;
    /// 4. иначе событие, когда с прошлого события набралось >= emitEvery
    ///    байт или поток дочитан до total.
    /// @return число байт, 0 = конец потока
    /// @throws TransferCancelled если флаг установлен
    size_t read(uint8_t* buf, size_t len);

    uint64_t sent() const noexcept { return m_sent; }
    uint64_t total() const noexcept { return m_total; }
    bool doneEmitted() const noexcept { return m_doneEmitted; }
    const std::string& uploadId() const noexcept { return m_uploadId; }

private:
    void emit(bool done);

    ByteSource m_source;
    std::shared_ptr<CancellationFlag> m_flag;
    std::string m_uploadId;
    uint64_t m_total;
    size_t m_emitEvery;
    ProgressSink m_sink;

    uint64_t m_sent = 0;
    uint64_t m_lastEmit = 0;
    bool m_doneEmitted = false;
};

} // namespace LocalSync
