#pragma once

#include <rediscache/compression/ICompressor.hpp>

#include <zlib.h>

#include <stdexcept>
#include <string>

/**
 * @brief Сжатие через zlib (deflate/inflate)
 *
 * Формат — стандартный zlib-поток (RFC 1950), совместим с любым
 * zlib-клиентом. Распаковка потоковая: исходный размер заранее не
 * хранится, буфер растёт по мере inflate.
 *
 * Экземпляр не хранит состояние между вызовами — потокобезопасен.
 */
class ZlibCompressor : public ICompressor {
public:
    /**
     * @param level Уровень сжатия: 0..9 или Z_DEFAULT_COMPRESSION
     */
    explicit ZlibCompressor(int level = Z_DEFAULT_COMPRESSION)
        : level_(level)
    {
        if (level_ != Z_DEFAULT_COMPRESSION && (level_ < 0 || level_ > 9)) {
            throw std::invalid_argument("zlib compression level must be in [0, 9]");
        }
    }

    Bytes compress(const Bytes& data) override {
        if (data.empty()) {
            return {};
        }

        z_stream stream{};
        if (deflateInit(&stream, level_) != Z_OK) {
            throw std::runtime_error("deflateInit failed");
        }

        Bytes out(deflateBound(&stream, static_cast<uLong>(data.size())));
        stream.next_in = const_cast<Bytef*>(data.data());
        stream.avail_in = static_cast<uInt>(data.size());
        stream.next_out = out.data();
        stream.avail_out = static_cast<uInt>(out.size());

        int rc = deflate(&stream, Z_FINISH);
        size_t written = stream.total_out;
        deflateEnd(&stream);

        if (rc != Z_STREAM_END) {
            throw std::runtime_error("deflate failed: " + std::to_string(rc));
        }
        out.resize(written);
        return out;
    }

    Bytes decompress(const Bytes& data) override {
        if (data.empty()) {
            return {};
        }

        z_stream stream{};
        if (inflateInit(&stream) != Z_OK) {
            throw std::runtime_error("inflateInit failed");
        }

        Bytes out(data.size() * 4 + 64);
        stream.next_in = const_cast<Bytef*>(data.data());
        stream.avail_in = static_cast<uInt>(data.size());

        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            if (stream.total_out == out.size()) {
                out.resize(out.size() * 2);
            }
            stream.next_out = out.data() + stream.total_out;
            stream.avail_out = static_cast<uInt>(out.size() - stream.total_out);

            rc = inflate(&stream, Z_NO_FLUSH);
            if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
                // Вход закончился, а конца потока нет — данные обрезаны
                break;
            }
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                break;
            }
        }

        size_t written = stream.total_out;
        inflateEnd(&stream);

        if (rc != Z_STREAM_END) {
            throw std::runtime_error("inflate failed: corrupt or truncated zlib stream");
        }
        out.resize(written);
        return out;
    }

    int level() const { return level_; }

private:
    int level_;
};
