#include "audiometadatareader.h"
#include "utils/logging.h"

#include <QFile>
#include <QFileInfo>
#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
}

bool AudioMetadataReader::isAudioFile(const QString &fileName)
{
    return formatFromExtension(fileName) != Format::Unknown;
}

AudioMetadataReader::Format AudioMetadataReader::formatFromExtension(const QString &fileName)
{
    QString ext = QFileInfo(fileName).suffix().toLower();

    if (ext == "wav") {
        return Format::Wav;
    }
    if (ext == "aif" || ext == "aiff") {
        return Format::Aiff;
    }
    if (ext == "mp3") {
        return Format::Mp3;
    }
    if (ext == "flac") {
        return Format::Flac;
    }
    if (ext == "ogg") {
        return Format::Ogg;
    }
    if (ext == "m4a") {
        return Format::M4a;
    }
    return Format::Unknown;
}

AudioMetadataReader::AudioInfo AudioMetadataReader::parse(const QByteArray &data)
{
    if (data.size() < ContainerHeaderSize) {
        return AudioInfo();
    }

    QByteArray magic = data.left(4);
    QByteArray formType = data.mid(8, 4);

    if (magic == "RIFF" && formType == "WAVE") {
        return parseWav(data);
    }
    if (magic == "FORM" && (formType == "AIFF" || formType == "AIFC")) {
        return parseAiff(data);
    }
    return AudioInfo();
}

AudioMetadataReader::AudioInfo AudioMetadataReader::readFile(const QString &path)
{
    Format format = formatFromExtension(path);
    if (format != Format::Wav && format != Format::Aiff && format != Format::Unknown) {
        return readWithFfmpeg(path, format);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return AudioInfo();
    }
    return parse(file.read(MaxHeaderBytes));
}

QString AudioMetadataReader::formatForFileName(const QString &fileName)
{
    switch (formatFromExtension(fileName)) {
    case Format::Wav:
        return QStringLiteral("WAV");
    case Format::Aiff:
        return QStringLiteral("AIF");
    case Format::Mp3:
        return QStringLiteral("MP3");
    case Format::Flac:
        return QStringLiteral("FLAC");
    case Format::Ogg:
        return QStringLiteral("OGG");
    case Format::M4a:
        return QStringLiteral("M4A");
    case Format::Unknown:
        break;
    }
    return QString();
}

AudioMetadataReader::AudioInfo AudioMetadataReader::readWithFfmpeg(const QString &path,
                                                                   Format format)
{
    static bool logLevelSet = false;
    if (!logLevelSet) {
        av_log_set_level(AV_LOG_ERROR);
        logLevelSet = true;
    }

    AudioInfo info;
    AVFormatContext *fmtCtx = nullptr;
    QByteArray localPath = QFile::encodeName(path);
    int ret = avformat_open_input(&fmtCtx, localPath.constData(), nullptr, nullptr);
    if (ret < 0) {
        LOG_VERBOSE() << "AudioMetadataReader: avformat_open_input failed" << ret << "for" << path;
        return info;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        LOG_VERBOSE() << "AudioMetadataReader: avformat_find_stream_info failed" << ret
                      << "for" << path;
        avformat_close_input(&fmtCtx);
        return info;
    }

    int audioIndex = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioIndex >= 0) {
        const AVCodecParameters *params = fmtCtx->streams[audioIndex]->codecpar;
        info.format = format;
        info.channels = params->ch_layout.nb_channels;
        info.sampleRate = params->sample_rate;
        // Lossy codecs carry no bit depth
        info.bitDepth = params->bits_per_raw_sample > 0 ? params->bits_per_raw_sample
                                                        : params->bits_per_coded_sample;
        info.valid = info.channels > 0 && info.sampleRate > 0;
    }

    avformat_close_input(&fmtCtx);
    return info;
}

AudioMetadataReader::AudioInfo AudioMetadataReader::parseWav(const QByteArray &data)
{
    AudioInfo info;
    int offset = ContainerHeaderSize;

    // RIFF chunks are little-endian and padded to an even size
    while (offset + ChunkHeaderSize <= data.size()) {
        QByteArray chunkId = data.mid(offset, 4);
        quint32 chunkSize = readLe32(data, offset + 4);
        int body = offset + ChunkHeaderSize;

        if (chunkId == "fmt ") {
            if (chunkSize < WavFmtMinSize || body + WavFmtMinSize > data.size()) {
                return info;
            }
            info.format = Format::Wav;
            info.channels = readLe16(data, body + 2);
            info.sampleRate = static_cast<int>(readLe32(data, body + 4));
            info.bitDepth = readLe16(data, body + 14);
            info.valid = info.channels > 0 && info.sampleRate > 0;
            return info;
        }

        qint64 next = static_cast<qint64>(body) + chunkSize + (chunkSize & 1);
        if (next > data.size()) {
            break;
        }
        offset = static_cast<int>(next);
    }

    return info;
}

AudioMetadataReader::AudioInfo AudioMetadataReader::parseAiff(const QByteArray &data)
{
    AudioInfo info;
    int offset = ContainerHeaderSize;

    // IFF chunks are big-endian and padded to an even size
    while (offset + ChunkHeaderSize <= data.size()) {
        QByteArray chunkId = data.mid(offset, 4);
        quint32 chunkSize = readBe32(data, offset + 4);
        int body = offset + ChunkHeaderSize;

        if (chunkId == "COMM") {
            if (chunkSize < AiffCommMinSize || body + AiffCommMinSize > data.size()) {
                return info;
            }
            info.format = Format::Aiff;
            info.channels = readBe16(data, body);
            info.bitDepth = readBe16(data, body + 6);
            info.sampleRate = readExtendedRate(data, body + 8);
            info.valid = info.channels > 0 && info.sampleRate > 0;
            return info;
        }

        qint64 next = static_cast<qint64>(body) + chunkSize + (chunkSize & 1);
        if (next > data.size()) {
            break;
        }
        offset = static_cast<int>(next);
    }

    return info;
}

quint16 AudioMetadataReader::readLe16(const QByteArray &data, int offset)
{
    if (offset + 1 >= data.size()) {
        return 0;
    }
    return static_cast<quint8>(data.at(offset)) |
           (static_cast<quint8>(data.at(offset + 1)) << 8);
}

quint32 AudioMetadataReader::readLe32(const QByteArray &data, int offset)
{
    if (offset + 3 >= data.size()) {
        return 0;
    }
    return static_cast<quint32>(static_cast<quint8>(data.at(offset))) |
           (static_cast<quint32>(static_cast<quint8>(data.at(offset + 1))) << 8) |
           (static_cast<quint32>(static_cast<quint8>(data.at(offset + 2))) << 16) |
           (static_cast<quint32>(static_cast<quint8>(data.at(offset + 3))) << 24);
}

quint16 AudioMetadataReader::readBe16(const QByteArray &data, int offset)
{
    if (offset + 1 >= data.size()) {
        return 0;
    }
    return (static_cast<quint8>(data.at(offset)) << 8) |
           static_cast<quint8>(data.at(offset + 1));
}

quint32 AudioMetadataReader::readBe32(const QByteArray &data, int offset)
{
    if (offset + 3 >= data.size()) {
        return 0;
    }
    return (static_cast<quint32>(static_cast<quint8>(data.at(offset))) << 24) |
           (static_cast<quint32>(static_cast<quint8>(data.at(offset + 1))) << 16) |
           (static_cast<quint32>(static_cast<quint8>(data.at(offset + 2))) << 8) |
           static_cast<quint32>(static_cast<quint8>(data.at(offset + 3)));
}

int AudioMetadataReader::readExtendedRate(const QByteArray &data, int offset)
{
    // 80-bit IEEE 754 extended: sign + 15-bit exponent, 64-bit mantissa
    if (offset + 9 >= data.size()) {
        return 0;
    }

    int exponent = ((static_cast<quint8>(data.at(offset)) & 0x7F) << 8) |
                   static_cast<quint8>(data.at(offset + 1));
    quint64 mantissa = 0;
    for (int i = 0; i < 8; ++i) {
        mantissa = (mantissa << 8) | static_cast<quint8>(data.at(offset + 2 + i));
    }

    if (exponent == 0 && mantissa == 0) {
        return 0;
    }

    // Negative or beyond int range
    int unbiased = exponent - 16383;
    if ((static_cast<quint8>(data.at(offset)) & 0x80) || unbiased < 0 || unbiased > 29) {
        return 0;
    }

    double value = std::ldexp(static_cast<double>(mantissa), exponent - 16383 - 63);
    return static_cast<int>(std::lround(value));
}
