#include "FileHasher.hpp"
#include "FileOpsError.hpp"

#include <blake3.h>
#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX* Context) const
        {
            EVP_MD_CTX_free(Context);
        }
    };

    std::string ToHex(const unsigned char* Bytes, size_t Length)
    {
        std::ostringstream Stream;
        Stream << std::hex << std::setfill('0');
        for (size_t i = 0; i < Length; ++i)
        {
            Stream << std::setw(2) << static_cast<unsigned int>(Bytes[i]);
        }
        return Stream.str();
    }
}

struct FileHasher::State
{
    uLong Crc = 0;
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> Digest;
    blake3_hasher Blake3;
};

const char* ToString(HashAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case HashAlgorithm::CRC32:  return "crc32";
    case HashAlgorithm::MD5:    return "md5";
    case HashAlgorithm::SHA256: return "sha256";
    case HashAlgorithm::SHA512: return "sha512";
    case HashAlgorithm::BLAKE3: return "blake3";
    default:                    return "unknown";
    }
}

std::optional<HashAlgorithm> ParseHashAlgorithm(const std::string& Name)
{
    std::string Lower = Name;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });

    if (Lower == "crc32")  return HashAlgorithm::CRC32;
    if (Lower == "md5")    return HashAlgorithm::MD5;
    if (Lower == "sha256") return HashAlgorithm::SHA256;
    if (Lower == "sha512") return HashAlgorithm::SHA512;
    if (Lower == "blake3") return HashAlgorithm::BLAKE3;
    return std::nullopt;
}

FileHasher::FileHasher(HashAlgorithm Algorithm) : Algorithm(Algorithm), Impl(std::make_unique<State>())
{
    const EVP_MD* Md = nullptr;
    switch (Algorithm)
    {
    case HashAlgorithm::CRC32:
        Impl->Crc = crc32(0L, Z_NULL, 0);
        return;
    case HashAlgorithm::BLAKE3:
        blake3_hasher_init(&Impl->Blake3);
        return;
    case HashAlgorithm::MD5:
        Md = EVP_md5();
        break;
    case HashAlgorithm::SHA256:
        Md = EVP_sha256();
        break;
    case HashAlgorithm::SHA512:
        Md = EVP_sha512();
        break;
    }

    Impl->Digest.reset(EVP_MD_CTX_new());
    if (!Impl->Digest || EVP_DigestInit_ex(Impl->Digest.get(), Md, nullptr) != 1)
    {
        throw FileOperationError(FileErrorKind::IOError, std::string("Could not initialise ") + ToString(Algorithm) + " digest");
    }
}

FileHasher::~FileHasher() = default;

void FileHasher::Update(const void* Data, size_t Length)
{
    if (Finalized)
    {
        throw std::logic_error("FileHasher::Update called after FinalHex");
    }

    const unsigned char* Bytes = static_cast<const unsigned char*>(Data);
    switch (Algorithm)
    {
    case HashAlgorithm::CRC32:
        while (Length > 0)
        {
            uInt Piece = static_cast<uInt>(std::min<size_t>(Length, std::numeric_limits<uInt>::max()));
            Impl->Crc = crc32(Impl->Crc, Bytes, Piece);
            Bytes += Piece;
            Length -= Piece;
        }
        break;
    case HashAlgorithm::BLAKE3:
        blake3_hasher_update(&Impl->Blake3, Bytes, Length);
        break;
    default:
        if (EVP_DigestUpdate(Impl->Digest.get(), Bytes, Length) != 1)
        {
            throw FileOperationError(FileErrorKind::IOError, std::string("Digest update failed for ") + ToString(Algorithm));
        }
        break;
    }
}

std::string FileHasher::FinalHex()
{
    if (Finalized)
    {
        throw std::logic_error("FileHasher::FinalHex called twice");
    }
    Finalized = true;

    switch (Algorithm)
    {
    case HashAlgorithm::CRC32:
    {
        std::ostringstream Stream;
        Stream << std::hex << std::setw(8) << std::setfill('0') << (Impl->Crc & 0xFFFFFFFFUL);
        return Stream.str();
    }
    case HashAlgorithm::BLAKE3:
    {
        uint8_t Out[BLAKE3_OUT_LEN];
        blake3_hasher_finalize(&Impl->Blake3, Out, BLAKE3_OUT_LEN);
        return ToHex(Out, BLAKE3_OUT_LEN);
    }
    default:
    {
        unsigned char Out[EVP_MAX_MD_SIZE];
        unsigned int OutLength = 0;
        if (EVP_DigestFinal_ex(Impl->Digest.get(), Out, &OutLength) != 1)
        {
            throw FileOperationError(FileErrorKind::IOError, std::string("Digest finalisation failed for ") + ToString(Algorithm));
        }
        return ToHex(Out, OutLength);
    }
    }
}

std::string FileHasher::HashFile(const std::string& Path, HashAlgorithm Algorithm, size_t ChunkSize)
{
    std::error_code Ec;
    uintmax_t FileSize = FS::file_size(Path, Ec);
    if (Ec)
    {
        throw FileOperationError(ClassifyErrorCode(Ec), "Cannot read " + Path + ": " + Ec.message());
    }

    std::ifstream File(Path, std::ios::binary);
    if (!File.is_open())
    {
        throw FileOperationError(ClassifyErrno(errno), "Failed to open " + Path + " for hashing");
    }

    size_t BufferSize = static_cast<size_t>(std::max<uintmax_t>(1, std::min<uintmax_t>(ChunkSize, FileSize)));
    std::vector<char> Buffer(BufferSize);
    FileHasher Hasher(Algorithm);

    while (File)
    {
        File.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        std::streamsize Got = File.gcount();
        if (Got > 0)
        {
            Hasher.Update(Buffer.data(), static_cast<size_t>(Got));
        }
    }
    if (File.bad())
    {
        throw FileOperationError(FileErrorKind::IOError, "Read error while hashing " + Path);
    }
    return Hasher.FinalHex();
}
