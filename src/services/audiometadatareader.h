/**
 * @file audiometadatareader.h
 * @brief Reader for audio file metadata.
 *
 * Extracts channel count, bit depth and sample rate so the browser can
 * show and filter them. WAV and AIFF headers are parsed directly; the
 * compressed containers are opened through FFmpeg.
 */

#ifndef AUDIOMETADATAREADER_H
#define AUDIOMETADATAREADER_H

#include <QByteArray>
#include <QString>

/**
 * @brief Reader for RIFF/WAVE and FORM/AIFF headers, plus FFmpeg-backed
 * lookup for MP3, FLAC, OGG and M4A.
 *
 * For WAV and AIFF only the format chunk is interpreted. Files that are not
 * understood, or whose header is truncated, yield an invalid AudioInfo.
 */
class AudioMetadataReader
{
public:
    /// @name Header Constants
    /// @{
    static constexpr int ContainerHeaderSize = 12;  ///< "RIFF"/"FORM" + size + form type
    static constexpr int ChunkHeaderSize = 8;       ///< Chunk id + chunk size
    static constexpr int WavFmtMinSize = 16;        ///< PCM fmt chunk body
    static constexpr int AiffCommMinSize = 18;      ///< COMM chunk body
    static constexpr int MaxHeaderBytes = 65536;    ///< Bytes read from disk by readFile()
    /// @}

    /**
     * @brief Container format of an audio file.
     */
    enum class Format {
        Unknown,  ///< Not recognized
        Wav,      ///< RIFF/WAVE
        Aiff,     ///< FORM/AIFF or FORM/AIFC
        Mp3,
        Flac,
        Ogg,
        M4a
    };

    /**
     * @brief Parsed audio header information.
     */
    struct AudioInfo {
        bool valid = false;
        Format format = Format::Unknown;
        int channels = 0;
        int bitDepth = 0;
        int sampleRate = 0;
    };

    /**
     * @brief Checks whether a file name has a supported audio extension.
     * @param fileName File name or path.
     * @return True for .wav, .aif, .aiff, .mp3, .flac, .ogg and .m4a
     *         (case-insensitive).
     */
    [[nodiscard]] static bool isAudioFile(const QString &fileName);

    /// @brief Maps a file name's extension to a Format.
    [[nodiscard]] static Format formatFromExtension(const QString &fileName);

    /**
     * @brief Parses header data already loaded into memory.
     * @param data The leading bytes of the file.
     * @return Parsed info; valid is false if the header is not understood.
     */
    [[nodiscard]] static AudioInfo parse(const QByteArray &data);

    /**
     * @brief Reads the metadata of a file on disk.
     *
     * WAV and AIFF go through parse(); the other audio formats are opened
     * with FFmpeg and the best audio stream's parameters are used.
     *
     * @param path Absolute file path.
     * @return Parsed info; valid is false if the file cannot be read.
     */
    [[nodiscard]] static AudioInfo readFile(const QString &path);

    /**
     * @brief Returns the short display name of the format for a file name.
     * @param fileName File name or path.
     * @return "WAV", "AIF", "MP3", "FLAC", "OGG", "M4A" or an empty string.
     */
    [[nodiscard]] static QString formatForFileName(const QString &fileName);

private:
    static AudioInfo readWithFfmpeg(const QString &path, Format format);
    static AudioInfo parseWav(const QByteArray &data);
    static AudioInfo parseAiff(const QByteArray &data);

    static quint16 readLe16(const QByteArray &data, int offset);
    static quint32 readLe32(const QByteArray &data, int offset);
    static quint16 readBe16(const QByteArray &data, int offset);
    static quint32 readBe32(const QByteArray &data, int offset);
    static int readExtendedRate(const QByteArray &data, int offset);
};

#endif // AUDIOMETADATAREADER_H
