#include "ConflictResolver.hpp"
#include "FileOpsError.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    void TestParseActions(TestContext& T)
    {
        T.Check(ParseConflictAction("skip") == ConflictAction::Skip, "skip should parse");
        T.Check(ParseConflictAction("OVERWRITE_OLDER") == ConflictAction::OverwriteIfNewer, "parsing should ignore case");
        T.Check(ParseConflictAction("Rename") == ConflictAction::Rename, "Rename should parse");
        T.Check(!ParseConflictAction("bogus").has_value(), "unknown action should not parse");
        T.Check(std::string(ToString(ConflictAction::OverwriteIfNewer)) == "overwrite_older", "OverwriteIfNewer should print as overwrite_older");
    }

    void TestFixedActions(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("src.txt"), "new");
        WriteFile(Dir.File("dst.txt"), "old");

        ConflictResolver Skipper(ConflictAction::Skip);
        T.Check(Skipper.Resolve(Dir.File("src.txt"), Dir.File("dst.txt")).Action == ConflictAction::Skip, "Skip policy should skip");

        ConflictResolver Overwriter(ConflictAction::Overwrite);
        ConflictResolution Overwrite = Overwriter.Resolve(Dir.File("src.txt"), Dir.File("dst.txt"));
        T.Check(Overwrite.Action == ConflictAction::Overwrite, "Overwrite policy should overwrite");
        T.Check(Overwrite.NewPath.empty(), "Overwrite should not produce a new path");
    }

    void TestRenameCounter(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("incoming.txt"), "data");
        WriteFile(Dir.File("report.txt"), "existing");

        ConflictResolver Resolver(ConflictAction::Rename);
        ConflictResolution First = Resolver.Resolve(Dir.File("incoming.txt"), Dir.File("report.txt"));
        T.Check(First.Action == ConflictAction::Rename, "Rename policy should rename");
        T.Check(FS::path(First.NewPath).filename() == "report (1).txt", "first rename should be 'report (1).txt', got " + First.NewPath);
        T.Check(FS::path(First.NewPath).parent_path() == Dir.Path(), "renamed file should stay in the destination directory");

        WriteFile(First.NewPath, "taken");
        ConflictResolution Second = Resolver.Resolve(Dir.File("incoming.txt"), Dir.File("report.txt"));
        T.Check(FS::path(Second.NewPath).filename() == "report (2).txt", "second rename should be 'report (2).txt', got " + Second.NewPath);
    }

    void TestCustomPattern(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("photo.jpg"), "x");

        ConflictResolver Resolver(ConflictAction::Rename, "{stem}_copy{counter}{suffix}");
        T.Check(FS::path(Resolver.GenerateUniqueName(Dir.File("photo.jpg"))).filename() == "photo_copy1.jpg", "custom pattern should expand every placeholder");

        ConflictResolver Stamped(ConflictAction::Rename, "{stem}-{timestamp}-{counter}{suffix}");
        std::string Name = FS::path(Stamped.GenerateUniqueName(Dir.File("photo.jpg"))).filename().string();
        T.Check(Name.rfind("photo-", 0) == 0 && Name.find("{timestamp}") == std::string::npos, "timestamp placeholder should be expanded, got " + Name);

        std::vector<std::string> Preview = Resolver.GetRenamePreview(Dir.File("photo.jpg"), 3);
        T.Check(Preview.size() == 3, "preview should offer three names");
        if (Preview.size() == 3)
        {
            T.Check(FS::path(Preview[2]).filename() == "photo_copy3.jpg", "third preview should use counter 3");
        }
    }

    void TestOverwriteIfNewer(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("src.txt"), "new");
        WriteFile(Dir.File("dst.txt"), "old");
        SetMTime(Dir.File("src.txt"), std::chrono::seconds(0));
        SetMTime(Dir.File("dst.txt"), std::chrono::seconds(-3600));

        ConflictResolver Resolver(ConflictAction::OverwriteIfNewer);
        T.Check(Resolver.Resolve(Dir.File("src.txt"), Dir.File("dst.txt")).Action == ConflictAction::Overwrite, "newer source should overwrite");

        SetMTime(Dir.File("dst.txt"), std::chrono::seconds(3600));
        T.Check(Resolver.Resolve(Dir.File("src.txt"), Dir.File("dst.txt")).Action == ConflictAction::Skip, "older source should be skipped");
    }

    void TestAskWithoutCallbackRenames(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "a");
        WriteFile(Dir.File("b.txt"), "b");

        ConflictResolver Resolver(ConflictAction::Ask);
        ConflictResolution Resolution = Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(Resolution.Action == ConflictAction::Rename, "Ask without a callback should rename");
        T.Check(FS::path(Resolution.NewPath).filename() == "b (1).txt", "Ask without a callback should produce 'b (1).txt'");
    }

    void TestApplyToAllIsSticky(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "a");
        WriteFile(Dir.File("b.txt"), "b");

        int Calls = 0;
        ConflictResolver Resolver(ConflictAction::Ask);
        Resolver.SetCallback([&Calls](const std::string&, const std::string&)
        {
                ++Calls;
                ConflictResolution Answer;
                Answer.Action = ConflictAction::Skip;
                Answer.ApplyToAll = true;
                return Answer;
        });

        T.Check(Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt")).Action == ConflictAction::Skip, "callback answer should be used");
        T.Check(Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt")).Action == ConflictAction::Skip, "apply-to-all answer should repeat");
        T.Check(Calls == 1, "callback should be asked only once, asked " + std::to_string(Calls));
        T.Check(Resolver.GetApplyToAll() == ConflictAction::Skip, "apply-to-all should be recorded");

        Resolver.ResetApplyToAll();
        Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(Calls == 2, "callback should be asked again after reset");
    }

    void TestCallbackRenameWithPath(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "a");
        WriteFile(Dir.File("b.txt"), "b");
        std::string Chosen = Dir.File("chosen.txt");

        ConflictResolver Resolver(ConflictAction::Ask);
        Resolver.SetCallback([&Chosen](const std::string&, const std::string&)
        {
                ConflictResolution Answer;
                Answer.Action = ConflictAction::Rename;
                Answer.NewPath = Chosen;
                return Answer;
        });
        ConflictResolution Resolution = Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(Resolution.Action == ConflictAction::Rename && Resolution.NewPath == Chosen, "callback supplied path should be kept");
    }

    void TestCallbackRenameOntoTakenPath(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("a.txt"), "a");
        WriteFile(Dir.File("b.txt"), "b");
        WriteFile(Dir.File("occupied.txt"), "keep me");
        std::string Requested = Dir.File("occupied.txt");

        ConflictResolver Resolver(ConflictAction::Ask);
        Resolver.SetCallback([&Requested](const std::string&, const std::string&)
        {
                ConflictResolution Answer;
                Answer.Action = ConflictAction::Rename;
                Answer.NewPath = Requested;
                return Answer;
        });

        ConflictResolution Existing = Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(Existing.Action == ConflictAction::Rename, "taken name should still rename");
        T.Check(FS::path(Existing.NewPath).filename() == "b (1).txt", "existing file must not be reused, got " + Existing.NewPath);

        Requested = Dir.File("reserved.txt");
        Resolver.Reserve(Requested);
        ConflictResolution Claimed = Resolver.Resolve(Dir.File("a.txt"), Dir.File("b.txt"));
        T.Check(Claimed.NewPath != Requested, "name claimed earlier in the batch must not be reused");
    }

    void TestReservedNamesAreSkipped(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("dst.txt"), "old");

        ConflictResolver Resolver(ConflictAction::Rename);
        ConflictResolution First = Resolver.Resolve(Dir.File("a.txt"), Dir.File("dst.txt"));
        Resolver.Reserve(First.NewPath);
        ConflictResolution Second = Resolver.Resolve(Dir.File("b.txt"), Dir.File("dst.txt"));
        T.Check(FS::path(First.NewPath).filename() == "dst (1).txt", "first rename, got " + First.NewPath);
        T.Check(FS::path(Second.NewPath).filename() == "dst (2).txt", "second rename should skip the reserved name, got " + Second.NewPath);
        T.Check(Resolver.IsReserved(Dir.Path().string() + "/./dst (1).txt"), "reservations should match normalized paths");

        std::vector<std::string> Preview = Resolver.GetRenamePreview(Dir.File("dst.txt"), 1);
        T.Check(Preview.size() == 1 && FS::path(Preview[0]).filename() == "dst (2).txt", "preview should skip reserved names");
    }

    void TestBatchRename(TestContext& T)
    {
        TempDir Dir;
        std::vector<std::string> Paths{ Dir.File("x.txt"), Dir.File("y.txt") };
        auto Renamed = ConflictResolver::BatchRenameWithPattern(Paths, "file_{index}{suffix}");
        T.Check(FS::path(Renamed[Paths[0]]).filename() == "file_1.txt", "first batch name should use index 1");
        T.Check(FS::path(Renamed[Paths[1]]).filename() == "file_2.txt", "second batch name should use index 2");

        auto Collapsed = ConflictResolver::BatchRenameWithPattern(Paths, "same_{counter}{suffix}");
        T.Check(Collapsed[Paths[0]] != Collapsed[Paths[1]], "batch rename should not hand out one name twice");

        T.Check(FS::path(ConflictResolver::CustomRename(Dir.File("x.txt"), "z.md")).filename() == "z.md", "custom rename should replace the file name");
    }

    void TestValidateAndInfo(TestContext& T)
    {
        TempDir Dir;
        WriteFile(Dir.File("small.bin"), "12");
        WriteFile(Dir.File("large.bin"), "1234567890");

        T.Check(!ConflictResolver::ValidateDestination(Dir.File("small.bin")).first, "existing file should not validate");
        T.Check(ConflictResolver::ValidateDestination(Dir.File("fresh.bin")).first, "new file in writable dir should validate");
        auto Missing = ConflictResolver::ValidateDestination(Dir.File("nope/fresh.bin"));
        T.Check(!Missing.first, "missing parent should not validate");
        T.CheckContains(Missing.second, "Parent directory does not exist", "missing parent should be explained");

        ConflictInfo Info = ConflictResolver::GetConflictInfo(Dir.File("large.bin"), Dir.File("small.bin"));
        T.Check(Info.SourceExists && Info.DestExists, "both sides should exist");
        T.Check(Info.SourceSize == 10 && Info.DestSize == 2, "sizes should be reported");
        T.Check(Info.SourceLarger && !Info.SameSize, "larger source should be flagged");
    }
}

int main()
{
    TestContext T;
    TestParseActions(T);
    TestFixedActions(T);
    TestRenameCounter(T);
    TestCustomPattern(T);
    TestOverwriteIfNewer(T);
    TestAskWithoutCallbackRenames(T);
    TestApplyToAllIsSticky(T);
    TestCallbackRenameWithPath(T);
    TestCallbackRenameOntoTakenPath(T);
    TestReservedNamesAreSkipped(T);
    TestBatchRename(T);
    TestValidateAndInfo(T);
    return T.Finish("conflict_resolver_tests");
}
