#include "FileCopier.hpp"
#include "FileMover.hpp"
#include "FileOpsError.hpp"
#include "FileVerifier.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    // Treats every pair as living on different volumes
    class CrossVolumeMover : public FileMover
    {
    public:
        using FileMover::FileMover;

        bool IsSameVolume(const std::string&, const std::string&) const override
        {
            return false;
        }
    };

    class MismatchVerifier : public FileVerifier
    {
    public:
        FileResult VerifyCopy(const std::string&, const std::string&) const override
        {
            return FileResult::Failure(FileErrorKind::HashMismatch, "Hash mismatch: aaaa vs bbbb");
        }
    };

    class BrokenCopier : public FileCopier
    {
    public:
        BrokenCopier() : FileCopier(1, nullptr, 1, std::chrono::milliseconds(1)) {}

        using FileCopier::CopyFile;

        bool CopyFile(const std::string&, const std::string& Dest, const ProgressCallback&, const CopyOptions&) override
        {
            WriteFile(Dest, "partial");
            std::error_code Ec;
            FS::remove(Dest, Ec);
            throw FileOperationError(FileErrorKind::IOError, "device went away");
        }
    };

    void TestSameVolumeMove(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "content");

        FileCopier Copier;
        FileMover Mover(Copier);
        T.Check(Mover.GetMoveStrategy(Dir.File("a.txt"), Dir.File("sub/b.txt")) == MoveStrategy::Rename, "same directory tree should be a rename");
        T.Check(!Mover.EstimateMoveTime(Dir.File("a.txt"), Dir.File("b.txt")).has_value(), "a rename has no time estimate");

        FileResult Result = Mover.MoveFile(Dir.File("a.txt"), Dir.File("sub/b.txt"));
        T.Check(Result.Success, "same volume move should succeed: " + Result.Error);
        T.Check(!FS::exists(Dir.File("a.txt")), "source should be gone after the move");
        T.Check(ReadFile(Dir.File("sub/b.txt")) == "content", "destination should hold the content");

        FileResult Missing = Mover.MoveFile(Dir.File("a.txt"), Dir.File("c.txt"));
        T.Check(!Missing.Success && Missing.Kind == FileErrorKind::SourceNotFound, "moving a missing file should fail as not found");
    }

    void TestCrossVolumeMove(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.bin"), Pattern(20000));

        FileVerifier Verifier;
        FileCopier Copier(2, &Verifier, 1, std::chrono::milliseconds(1));
        CrossVolumeMover Mover(Copier, &Verifier, true);
        T.Check(Mover.GetMoveStrategy(Dir.File("a.bin"), Dir.File("b.bin")) == MoveStrategy::CopyDelete, "cross volume should copy then delete");
        T.Check(Mover.EstimateMoveTime(Dir.File("a.bin"), Dir.File("b.bin"), 10000.0) == 2.0, "estimate is size over speed");

        uint64_t LastCopied = 0;
        FileResult Result = Mover.MoveFile(Dir.File("a.bin"), Dir.File("out/b.bin"), [&LastCopied](uint64_t Copied, uint64_t) { LastCopied = Copied; });
        T.Check(Result.Success, "cross volume move should succeed: " + Result.Error);
        T.Check(!FS::exists(Dir.File("a.bin")), "source should be deleted after a verified copy");
        T.Check(ReadFile(Dir.File("out/b.bin")) == Pattern(20000), "destination should match");
        T.Check(LastCopied == 20000, "copy progress should be forwarded");
    }

    void TestVerifyMismatchKeepsSource(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "precious");

        MismatchVerifier Verifier;
        FileCopier Copier(1, nullptr, 1, std::chrono::milliseconds(1));
        CrossVolumeMover Mover(Copier, &Verifier, true);

        FileResult Result = Mover.MoveFile(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(!Result.Success && Result.Kind == FileErrorKind::HashMismatch, "mismatch should fail the move");
        T.Check(ReadFile(Dir.File("a.txt")) == "precious", "source must survive a failed verification");
        T.Check(!FS::exists(Dir.File("b.txt")), "unverified destination should be removed");

        // Verification requested per call also applies
        CrossVolumeMover Lenient(Copier, &Verifier, false);
        CopyOptions Options;
        Options.Verify = true;
        T.Check(!Lenient.MoveFile(Dir.File("a.txt"), Dir.File("c.txt"), nullptr, Options).Success, "per-call verify should be honoured");
        T.Check(FS::exists(Dir.File("a.txt")), "source should still be there");
        T.Check(Lenient.MoveFile(Dir.File("a.txt"), Dir.File("d.txt")).Success, "without verification the move should go through");
    }

    void TestCopyFailureKeepsSource(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "precious");

        BrokenCopier Copier;
        CrossVolumeMover Mover(Copier);
        FileResult Result = Mover.MoveFile(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(!Result.Success, "a failed copy should fail the move");
        T.CheckContains(Result.Error, "device went away", "copy error should be passed on");
        T.Check(ReadFile(Dir.File("a.txt")) == "precious", "source must survive a failed copy");
        T.Check(!FS::exists(Dir.File("b.txt")), "no destination should remain");

        std::vector<std::pair<std::string, std::string>> Pairs{ { Dir.File("a.txt"), Dir.File("c.txt") } };
        ResultMap Batch = Mover.MoveFilesBatch(Pairs);
        T.Check(!Batch[Dir.File("c.txt")].Success && FS::exists(Dir.File("a.txt")), "batch failure should keep the source");
    }

    void TestCancelledMove(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "data");

        FileCopier Copier;
        FileMover Mover(Copier);
        Mover.Cancel();
        T.Check(Mover.MoveFile(Dir.File("a.txt"), Dir.File("b.txt")).IsCancelled(), "cancelled mover should not move");
        T.Check(FS::exists(Dir.File("a.txt")), "source should be untouched");
        Mover.ResetCancel();
        T.Check(Mover.MoveFile(Dir.File("a.txt"), Dir.File("b.txt")).Success, "move should work after reset");
    }

    void TestBatchMove(TestContext& T)
    {
        TempDir Dir;
        std::vector<std::pair<std::string, std::string>> Pairs;
        for (int i = 0; i < 5; ++i)
        {
            WriteFile(Dir.File("in/" + std::to_string(i)), "file" + std::to_string(i));
            Pairs.emplace_back(Dir.File("in/" + std::to_string(i)), Dir.File("out/" + std::to_string(i)));
        }

        FileCopier Copier(2);
        CrossVolumeMover Cross(Copier);
        std::vector<std::pair<std::string, std::string>> FarPairs(Pairs.begin(), Pairs.begin() + 3);
        std::vector<std::pair<std::string, std::string>> NearPairs(Pairs.begin() + 3, Pairs.end());
        ResultMap Results = Cross.MoveFilesBatch(FarPairs);
        FileMover Local(Copier);
        ResultMap More = Local.MoveFilesBatch(NearPairs);

        T.Check(Results.size() == 3 && More.size() == 2, "every pair should have a result");
        for (const auto& [Source, Dest] : Pairs)
        {
            T.Check(!FS::exists(Source) && FS::exists(Dest), "batch should move " + Source);
        }
    }

    void TestMoveDirectory(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("tree/a.txt"), "a");
        WriteFile(Dir.File("tree/sub/b.txt"), "bb");
        T.Check(FileMover::CalculateTotalSize({ Dir.File("tree"), Dir.File("tree/a.txt") }) == 4, "total size should cover trees and files");

        FileCopier Copier;
        FileMover Local(Copier);
        ResultMap Renamed = Local.MoveDirectory(Dir.File("tree"), Dir.File("moved"));
        T.Check(Renamed.size() == 2, "renamed tree should report each file");
        T.Check(!FS::exists(Dir.File("tree")) && ReadFile(Dir.File("moved/sub/b.txt")) == "bb", "same volume directory move should rename the tree");

        CrossVolumeMover Cross(Copier);
        ResultMap Copied = Cross.MoveDirectory(Dir.File("moved"), Dir.File("far/away"));
        T.Check(Copied.size() == 2, "file by file move should report each file");
        T.Check(ReadFile(Dir.File("far/away/a.txt")) == "a" && ReadFile(Dir.File("far/away/sub/b.txt")) == "bb", "files should arrive");
        T.Check(!FS::exists(Dir.File("moved")), "emptied source tree should be pruned");
    }
}

int main()
{
    TestContext T;
    TestSameVolumeMove(T);
    TestCrossVolumeMove(T);
    TestVerifyMismatchKeepsSource(T);
    TestCopyFailureKeepsSource(T);
    TestCancelledMove(T);
    TestBatchMove(T);
    TestMoveDirectory(T);
    return T.Finish("file_mover_tests");
}
