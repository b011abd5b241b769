#include "FileHasher.hpp"
#include "FileOpsError.hpp"
#include "FileVerifier.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

namespace
{
    void TestKnownDigests(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("abc.txt"), "abc");

        struct Expected
        {
            HashAlgorithm Algorithm;
            const char* Hex;
        };
        const Expected Cases[] = {
            { HashAlgorithm::CRC32, "352441c2" },
            { HashAlgorithm::MD5, "900150983cd24fb0d6963f7d28e17f72" },
            { HashAlgorithm::SHA256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" },
            { HashAlgorithm::BLAKE3, "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85" },
        };

        FileVerifier Verifier;
        for (const auto& Case : Cases)
        {
            std::string Actual = Verifier.CalculateHash(Dir.File("abc.txt"), Case.Algorithm);
            T.Check(Actual == Case.Hex, std::string(ToString(Case.Algorithm)) + " digest of 'abc' should be " + Case.Hex + ", got " + Actual);
        }
        T.Check(Verifier.CalculateHash(Dir.File("abc.txt"), HashAlgorithm::SHA512).size() == 128, "sha512 digest should be 128 hex chars");

        // Tiny chunks must not change the digest
        T.Check(FileHasher::HashFile(Dir.File("abc.txt"), HashAlgorithm::MD5, 1) == "900150983cd24fb0d6963f7d28e17f72", "digest should not depend on chunk size");

        T.Check(ParseHashAlgorithm("SHA256") == HashAlgorithm::SHA256, "algorithm names should parse case-insensitively");
        T.Check(ParseHashAlgorithm("blake3") == HashAlgorithm::BLAKE3, "blake3 should parse");
        T.Check(!ParseHashAlgorithm("sha1").has_value(), "unsupported algorithm should not parse");

        bool Threw = false;
        try
        {
            Verifier.CalculateHash(Dir.File("missing.txt"));
        }
        catch (const FileOperationError& e)
        {
            Threw = e.GetKind() == FileErrorKind::SourceNotFound;
        }
        T.Check(Threw, "hashing a missing file should throw SourceNotFound");
    }

    void TestVerifyCopy(TestContext& T)
    {
        TempDir Dir;
        FileVerifier Verifier(HashAlgorithm::SHA256);

        WriteFile(Dir.File("empty_a"), "");
        WriteFile(Dir.File("empty_b"), "");
        T.Check(Verifier.VerifyCopy(Dir.File("empty_a"), Dir.File("empty_b")).Success, "two empty files should verify");

        WriteFile(Dir.File("one_a"), "x");
        WriteFile(Dir.File("one_b"), "x");
        WriteFile(Dir.File("one_c"), "y");
        T.Check(Verifier.VerifyCopy(Dir.File("one_a"), Dir.File("one_b")).Success, "identical 1-byte files should verify");

        FileResult Differs = Verifier.VerifyCopy(Dir.File("one_a"), Dir.File("one_c"));
        T.Check(!Differs.Success && Differs.Kind == FileErrorKind::HashMismatch, "different 1-byte files should be a hash mismatch");
        T.CheckContains(Differs.Error, "Hash mismatch", "hash mismatch should be described");

        WriteFile(Dir.File("long"), "abcd");
        FileResult Sized = Verifier.VerifyCopy(Dir.File("one_a"), Dir.File("long"));
        T.Check(!Sized.Success && Sized.Kind == FileErrorKind::SizeMismatch, "different sizes should be a size mismatch");
        T.Check(Sized.Error == "Size mismatch: 1 vs 4", "size mismatch message, got " + Sized.Error);
        T.Check(IsVerificationMismatch(Sized.Kind) && IsVerificationMismatch(Differs.Kind), "both mismatches should count as verification mismatches");

        FileResult Missing = Verifier.VerifyCopy(Dir.File("one_a"), Dir.File("nothing"));
        T.Check(!Missing.Success && Missing.Kind == FileErrorKind::SourceNotFound, "missing destination should fail as not found");
    }

    void TestVerifyBatch(TestContext& T)
    {
        TempDir Dir;
        std::vector<std::pair<std::string, std::string>> Pairs;
        for (int i = 0; i < 6; ++i)
        {
            std::string Content = Pattern(1000 + static_cast<size_t>(i));
            WriteFile(Dir.File("src/" + std::to_string(i)), Content);
            WriteFile(Dir.File("dst/" + std::to_string(i)), i == 3 ? Content + "!" : Content);
            Pairs.emplace_back(Dir.File("src/" + std::to_string(i)), Dir.File("dst/" + std::to_string(i)));
        }

        FileVerifier Verifier;
        ResultMap Results = Verifier.VerifyBatch(Pairs, 3);
        T.Check(Results.size() == 6, "every pair should have a result");
        for (int i = 0; i < 6; ++i)
        {
            bool Ok = Results[Dir.File("dst/" + std::to_string(i))].Success;
            T.Check(i == 3 ? !Ok : Ok, "batch result for file " + std::to_string(i));
        }
    }

    void TestChecksumFiles(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("data/one.txt"), "first");
        WriteFile(Dir.File("data/two.txt"), "second");
        std::vector<std::string> Files{ Dir.File("data/one.txt"), Dir.File("data/two.txt"), Dir.File("data/absent.txt") };

        FileVerifier Verifier(HashAlgorithm::MD5);
        Verifier.GenerateChecksumFile(Files, Dir.File("data/SUMS.md5"));
        std::string Manifest = ReadFile(Dir.File("data/SUMS.md5"));
        T.CheckContains(Manifest, " *one.txt", "sum format should mark names with ' *'");
        T.CheckContains(Manifest, "# Error processing", "unreadable files should be noted as comments");

        ResultMap Results = Verifier.VerifyChecksumFile(Dir.File("data/SUMS.md5"));
        T.Check(Results.size() == 2, "comment lines should not produce results");
        T.Check(Results["one.txt"].Success && Results["two.txt"].Success, "fresh manifest should verify");

        WriteFile(Dir.File("data/two.txt"), "tampered");
        std::filesystem::remove(Dir.File("data/one.txt"));
        Results = Verifier.VerifyChecksumFile(Dir.File("data/SUMS.md5"));
        T.Check(Results["one.txt"].Error == "File not found", "deleted file should report File not found, got " + Results["one.txt"].Error);
        T.CheckContains(Results["two.txt"].Error, "Hash mismatch: expected", "modified file should report the expected hash");

        WriteFile(Dir.File("data/one.txt"), "first");
        Verifier.GenerateChecksumFile({ Dir.File("data/one.txt") }, Dir.File("manifests/simple.txt"), ChecksumFormat::Simple);
        T.CheckContains(ReadFile(Dir.File("manifests/simple.txt")), "one.txt: ", "simple format should be 'name: hash'");
        Results = Verifier.VerifyChecksumFile(Dir.File("manifests/simple.txt"), Dir.File("data"));
        T.Check(Results.size() == 1 && Results["one.txt"].Success, "base directory should override the manifest location");

        bool Threw = false;
        try
        {
            Verifier.VerifyChecksumFile(Dir.File("nope.md5"));
        }
        catch (const FileOperationError&)
        {
            Threw = true;
        }
        T.Check(Threw, "missing manifest should throw");
    }

    void TestCompareDirectories(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a/top.txt"), "top");
        WriteFile(Dir.File("a/sub/deep.txt"), "deep");
        WriteFile(Dir.File("a/sub/only_source.txt"), "lonely");
        WriteFile(Dir.File("b/top.txt"), "top");
        WriteFile(Dir.File("b/sub/deep.txt"), "DEEP");

        FileVerifier Verifier;
        ResultMap Results = Verifier.CompareDirectories(Dir.File("a"), Dir.File("b"));
        T.Check(Results.size() == 2, "files missing on the destination should be left out");
        T.Check(Results["top.txt"].Success, "matching file should verify");
        T.Check(Results.count("sub/deep.txt") == 1 && !Results["sub/deep.txt"].Success, "changed file should be keyed by relative path and fail");

        ResultMap Flat = Verifier.CompareDirectories(Dir.File("a"), Dir.File("b"), false);
        T.Check(Flat.size() == 1, "non-recursive compare should only see the top level");
    }

    void TestFileInfo(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("abc.txt"), "abc");
        FileVerifier Verifier(HashAlgorithm::CRC32);
        FileDigestInfo Info = Verifier.GetFileInfo(Dir.File("abc.txt"));
        T.Check(Info.Exists && Info.Size == 3, "info should report size");
        T.Check(Info.Hash == "352441c2" && Info.Algorithm == "crc32", "info should carry the digest and algorithm");
        T.Check(!Verifier.GetFileInfo(Dir.File("missing")).Exists, "missing file should not exist");
    }
}

int main()
{
    TestContext T;
    TestKnownDigests(T);
    TestVerifyCopy(T);
    TestVerifyBatch(T);
    TestChecksumFiles(T);
    TestCompareDirectories(T);
    TestFileInfo(T);
    return T.Finish("file_verifier_tests");
}
