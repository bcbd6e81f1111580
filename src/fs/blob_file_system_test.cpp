#include "blob_file_system.hpp"
#include "../errors.hpp"
#include "../store/memory_blob_store.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace blobfs;

namespace {
    const std::string kContainer = "media";

    std::vector<std::string> pathsOf(const std::vector<StoredFile>& files) {
        std::vector<std::string> paths;
        for (const auto& file : files) {
            paths.push_back(file.path());
        }
        return paths;
    }

    std::vector<std::string> pathsOf(const std::vector<StoredFolder>& folders) {
        std::vector<std::string> paths;
        for (const auto& folder : folders) {
            paths.push_back(folder.path());
        }
        return paths;
    }
}

class BlobFileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryBlobStore>("https://blobs.example.com/");
    }

    BlobFileSystem makeFileSystem(const std::string& root = "",
                                  ContainerAccess access = ContainerAccess::Private) {
        FileSystemOptions options;
        options.container_name = kContainer;
        options.root = root;
        options.access = access;
        return BlobFileSystem(store, options);
    }

    void put(const std::string& key, const std::string& content) {
        store->putObject(kContainer, key, content);
    }

    std::shared_ptr<MemoryBlobStore> store;
};

// ==================== Container binding ====================

TEST_F(BlobFileSystemTest, ConstructionCreatesContainerWithAccessPolicy) {
    EXPECT_FALSE(store->containerExists(kContainer));

    auto fs = makeFileSystem("", ContainerAccess::PublicRead);

    EXPECT_TRUE(store->containerExists(kContainer));
    EXPECT_EQ(store->containerAccess(kContainer), ContainerAccess::PublicRead);
    EXPECT_EQ(fs.containerName(), kContainer);
}

TEST_F(BlobFileSystemTest, ConstructionKeepsExistingObjects) {
    put("docs/a.txt", "hello");

    auto fs = makeFileSystem();

    EXPECT_TRUE(fs.fileExists("docs/a.txt"));
}

TEST_F(BlobFileSystemTest, ConstructionRequiresStoreAndContainer) {
    FileSystemOptions options;
    options.container_name = kContainer;
    EXPECT_THROW(BlobFileSystem(nullptr, options), std::invalid_argument);

    options.container_name.clear();
    EXPECT_THROW(BlobFileSystem(store, options), std::invalid_argument);
}

// ==================== Path validation ====================

TEST_F(BlobFileSystemTest, AbsoluteAndUrlPathsAreInvalid) {
    auto fs = makeFileSystem("site");

    for (const std::string path : {"/docs/a.txt", "http://example.com/a.txt", "gs://media/a.txt"}) {
        EXPECT_THROW(fs.fileExists(path), InvalidPathError) << path;
        EXPECT_THROW(fs.createFile(path), InvalidPathError) << path;
        EXPECT_THROW(fs.createFolder(path), InvalidPathError) << path;
        EXPECT_THROW(fs.listFiles(path), InvalidPathError) << path;
    }
    EXPECT_EQ(store->objectCount(kContainer), 0u);
}

TEST_F(BlobFileSystemTest, EmptyFilePathIsInvalid) {
    auto fs = makeFileSystem();

    EXPECT_THROW(fs.createFile(""), InvalidPathError);
    EXPECT_THROW(fs.getFile("/"), InvalidPathError);
}

// ==================== File operations ====================

TEST_F(BlobFileSystemTest, CreateThenDeleteFile) {
    auto fs = makeFileSystem();

    StoredFile file = fs.createFile("docs/a.txt");
    EXPECT_EQ(file.path(), "docs/a.txt");
    EXPECT_EQ(file.name(), "a.txt");
    EXPECT_EQ(file.fileType(), ".txt");
    EXPECT_EQ(file.size(), 0);
    EXPECT_TRUE(fs.fileExists("docs/a.txt"));

    fs.deleteFile("docs/a.txt");
    EXPECT_FALSE(fs.fileExists("docs/a.txt"));
}

TEST_F(BlobFileSystemTest, CreateExistingFileFails) {
    auto fs = makeFileSystem();
    fs.createFile("a.txt");

    EXPECT_THROW(fs.createFile("a.txt"), AlreadyExistsError);
}

TEST_F(BlobFileSystemTest, DeleteMissingFileFails) {
    auto fs = makeFileSystem();

    EXPECT_THROW(fs.deleteFile("a.txt"), NotFoundError);
}

TEST_F(BlobFileSystemTest, GetMissingFileFails) {
    auto fs = makeFileSystem();

    try {
        fs.getFile("missing.txt");
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(BlobFileSystemTest, KeysLiveUnderRoot) {
    auto fs = makeFileSystem("site/uploads");

    fs.createFile("docs/a.txt");

    EXPECT_TRUE(store->objectContent(kContainer, "site/uploads/docs/a.txt").has_value());
    EXPECT_EQ(fs.getFile("docs/a.txt").key(), "site/uploads/docs/a.txt");
    EXPECT_EQ(fs.getFile("docs/a.txt").path(), "docs/a.txt");
}

TEST_F(BlobFileSystemTest, WriteAndReadContent) {
    auto fs = makeFileSystem();
    StoredFile file = fs.createFile("notes.md");

    auto writer = file.openWrite();
    *writer << "# title\n";
    writer->close();

    StoredFile reloaded = fs.getFile("notes.md");
    EXPECT_EQ(reloaded.size(), 8);
    EXPECT_EQ(reloaded.readAll(), "# title\n");
    EXPECT_GT(reloaded.lastUpdated(), std::chrono::system_clock::time_point{});
}

TEST_F(BlobFileSystemTest, InterruptedWriteKeepsPreviousContent) {
    auto fs = makeFileSystem();
    put("notes.md", "previous");
    StoredFile file = fs.getFile("notes.md");

    EXPECT_THROW({
        auto writer = file.openWrite();
        *writer << "trunc";
        throw std::runtime_error("local source went away");
    }, std::runtime_error);

    EXPECT_EQ(fs.getFile("notes.md").readAll(), "previous");
}

TEST_F(BlobFileSystemTest, FailedWriteAllKeepsPreviousContent) {
    auto fs = makeFileSystem();
    put("notes.md", "previous");
    store->injectFault(MemoryBlobStore::FaultPoint::Write, "notes.md");

    EXPECT_THROW(fs.getFile("notes.md").writeAll("replacement"), StoreError);

    store->clearFaults();
    EXPECT_EQ(fs.getFile("notes.md").readAll(), "previous");
}

TEST_F(BlobFileSystemTest, RenameFilePreservesContent) {
    auto fs = makeFileSystem();
    const std::string content("binary\0bytes\xff", 13);
    put("a.bin", content);

    fs.renameFile("a.bin", "moved/b.bin");

    EXPECT_FALSE(fs.fileExists("a.bin"));
    EXPECT_TRUE(fs.fileExists("moved/b.bin"));
    EXPECT_EQ(fs.getFile("moved/b.bin").readAll(), content);
}

TEST_F(BlobFileSystemTest, RenameFileChecksSourceAndDestination) {
    auto fs = makeFileSystem();
    put("a.txt", "a");
    put("b.txt", "b");

    EXPECT_THROW(fs.renameFile("missing.txt", "c.txt"), NotFoundError);
    EXPECT_THROW(fs.renameFile("a.txt", "b.txt"), AlreadyExistsError);
    EXPECT_EQ(store->objectContent(kContainer, "b.txt"), std::string("b"));
}

TEST_F(BlobFileSystemTest, RenameFileFailingDeleteLeavesBothObjects) {
    auto fs = makeFileSystem();
    put("a.txt", "payload");
    store->injectFault(MemoryBlobStore::FaultPoint::Delete, "a.txt");

    EXPECT_THROW(fs.renameFile("a.txt", "b.txt"), StoreError);

    EXPECT_TRUE(fs.fileExists("a.txt"));
    EXPECT_TRUE(fs.fileExists("b.txt"));
}

TEST_F(BlobFileSystemTest, PublicUrlRoundTrip) {
    auto fs = makeFileSystem("site");
    put("site/docs/a.txt", "x");

    std::string url = fs.getPublicUrl("docs/a.txt");

    EXPECT_EQ(url, "https://blobs.example.com/media/site/docs/a.txt");
    EXPECT_EQ(fs.resolvePublicUrl(url), "docs/a.txt");
    EXPECT_THROW(fs.getPublicUrl("docs/missing.txt"), NotFoundError);
    EXPECT_THROW(fs.resolvePublicUrl("https://elsewhere.example.com/a.txt"), InvalidPathError);
}

// ==================== Listing ====================

TEST_F(BlobFileSystemTest, ListFilesHidesMarkersAndSubfolders) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "1");
    put("docs/b.txt", "22");
    put("docs/img/c.png", "333");
    put(std::string("docs/") + BlobFileSystem::kFolderMarker, "");

    EXPECT_EQ(pathsOf(fs.listFiles("docs")), (std::vector<std::string>{"docs/a.txt", "docs/b.txt"}));
}

TEST_F(BlobFileSystemTest, ForEachFileStopsEarly) {
    auto fs = makeFileSystem();
    put("a.txt", "");
    put("b.txt", "");
    put("c.txt", "");

    std::vector<std::string> seen;
    fs.forEachFile("", [&seen](const StoredFile& file) {
        seen.push_back(file.name());
        return seen.size() < 2;
    });

    EXPECT_EQ(seen, (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(BlobFileSystemTest, ListFoldersOnEmptyContainerCreatesRootMarker) {
    auto fs = makeFileSystem();

    EXPECT_TRUE(fs.listFolders("").empty());
    EXPECT_TRUE(store->objectContent(kContainer, BlobFileSystem::kFolderMarker).has_value());
    EXPECT_TRUE(fs.listFiles("").empty());
}

TEST_F(BlobFileSystemTest, ListFoldersCreatesMissingFolderUnderRoot) {
    auto fs = makeFileSystem("site");

    EXPECT_TRUE(fs.listFolders("docs").empty());
    EXPECT_TRUE(store->objectContent(kContainer, std::string("site/docs/") + BlobFileSystem::kFolderMarker).has_value());
    EXPECT_TRUE(fs.folderExists("docs"));
}

TEST_F(BlobFileSystemTest, ListFoldersReturnsImmediateChildren) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "");
    put("docs/img/x.png", "");
    put("docs/img/raw/y.raw", "");
    put("docs/video/z.mp4", "");

    auto folders = fs.listFolders("docs");

    EXPECT_EQ(pathsOf(folders), (std::vector<std::string>{"docs/img", "docs/video"}));
    EXPECT_EQ(folders[0].name(), "img");
    EXPECT_EQ(store->objectCount(kContainer), 4u);
}

TEST_F(BlobFileSystemTest, ListFoldersSkipsEmptySegments) {
    auto fs = makeFileSystem("site");
    put("site/docs//a.txt", "12");
    put("site/docs/img/x.png", "3");
    put("site//stray.txt", "4");

    EXPECT_EQ(pathsOf(fs.listFolders("docs")), (std::vector<std::string>{"docs/img"}));
    EXPECT_EQ(pathsOf(fs.listFolders("")), (std::vector<std::string>{"docs"}));
    EXPECT_EQ(fs.getFolderSize("docs"), 3);
}

// ==================== Folder operations ====================

TEST_F(BlobFileSystemTest, CreateFolderWritesHiddenMarker) {
    auto fs = makeFileSystem();

    fs.createFolder("docs");

    EXPECT_TRUE(fs.folderExists("docs"));
    EXPECT_TRUE(store->objectContent(kContainer, std::string("docs/") + BlobFileSystem::kFolderMarker).has_value());
    EXPECT_TRUE(fs.listFiles("docs").empty());
    EXPECT_THROW(fs.createFolder("docs"), AlreadyExistsError);
}

TEST_F(BlobFileSystemTest, CreateFolderFailsWhenFilesExistUnderIt) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "");

    EXPECT_THROW(fs.createFolder("docs"), AlreadyExistsError);
}

TEST_F(BlobFileSystemTest, DeleteFolderIsRecursive) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "");
    put("docs/img/x.png", "");
    put("docs/img/raw/y.raw", "");
    put("docsx/keep.txt", "");

    fs.deleteFolder("docs");

    EXPECT_FALSE(fs.folderExists("docs"));
    EXPECT_TRUE(fs.fileExists("docsx/keep.txt"));
    EXPECT_EQ(store->objectCount(kContainer), 1u);
    EXPECT_THROW(fs.deleteFolder("docs"), NotFoundError);
}

TEST_F(BlobFileSystemTest, RenameFolderMovesEverything) {
    auto fs = makeFileSystem("site");
    fs.createFolder("docs");
    put("site/docs/a.txt", "aaa");
    put("site/docs/img/x.png", "xx");

    fs.renameFolder("docs", "archive/docs");

    EXPECT_FALSE(fs.folderExists("docs"));
    EXPECT_EQ(fs.getFile("archive/docs/a.txt").readAll(), "aaa");
    EXPECT_EQ(fs.getFile("archive/docs/img/x.png").readAll(), "xx");
    EXPECT_TRUE(store->objectContent(kContainer, std::string("site/archive/docs/") + BlobFileSystem::kFolderMarker).has_value());
    EXPECT_EQ(store->objectCount(kContainer), 3u);
}

TEST_F(BlobFileSystemTest, RenameFolderValidatesPaths) {
    auto fs = makeFileSystem();
    fs.createFolder("docs");

    EXPECT_THROW(fs.renameFolder("missing", "other"), NotFoundError);
    EXPECT_THROW(fs.renameFolder("docs", "docs"), InvalidPathError);
    EXPECT_THROW(fs.renameFolder("docs", "docs/inner"), InvalidPathError);
    EXPECT_THROW(fs.renameFolder("", "other"), InvalidPathError);

    // A sibling sharing the name prefix is not inside
    EXPECT_NO_THROW(fs.renameFolder("docs", "docs2"));
    EXPECT_TRUE(fs.folderExists("docs2"));
}

TEST_F(BlobFileSystemTest, RenameFolderPartialFailureSurfaces) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "a");
    put("docs/b.txt", "b");
    store->injectFault(MemoryBlobStore::FaultPoint::Copy, "docs/b.txt");

    EXPECT_THROW(fs.renameFolder("docs", "files"), StoreError);

    // Nothing is rolled back
    EXPECT_TRUE(fs.fileExists("files/a.txt"));
    EXPECT_FALSE(fs.fileExists("docs/a.txt"));
    EXPECT_TRUE(fs.fileExists("docs/b.txt"));
}

TEST_F(BlobFileSystemTest, GetFolderAndParent) {
    auto fs = makeFileSystem();
    put("docs/img/x.png", "12");

    StoredFolder folder = fs.getFolder("docs/img");
    EXPECT_EQ(folder.name(), "img");
    EXPECT_EQ(folder.size(), 2);
    EXPECT_EQ(folder.lastUpdated(), std::chrono::system_clock::time_point::min());

    StoredFolder parent = folder.parent();
    EXPECT_EQ(parent.path(), "docs");
    EXPECT_TRUE(parent.parent().isRoot());
    EXPECT_THROW(parent.parent().parent(), NotFoundError);

    EXPECT_THROW(fs.getFolder("missing"), NotFoundError);
}

// ==================== Size aggregation ====================

TEST_F(BlobFileSystemTest, FolderSizeSumsAllDepths) {
    auto fs = makeFileSystem();
    put("docs/a.txt", "12345");
    put("docs/img/x.png", "1234567890");
    put("docs/img/raw/deep/y.raw", "123");
    put("other/z.txt", "1234567");

    EXPECT_EQ(fs.getFolderSize("docs"), 18);
    EXPECT_EQ(fs.getFolderSize("docs/img"), 13);
    EXPECT_EQ(fs.getFolderSize(""), 25);
}

TEST_F(BlobFileSystemTest, FolderSizeCountsMarkers) {
    auto fs = makeFileSystem();
    fs.createFolder("empty");

    EXPECT_EQ(fs.getFolderSize("empty"), 0);
    EXPECT_TRUE(fs.folderExists("empty"));
}

// ==================== End to end ====================

TEST_F(BlobFileSystemTest, CreateListSizeAndRenameScenario) {
    auto fs = makeFileSystem();

    fs.createFolder("docs");
    auto folders = fs.listFolders("");
    ASSERT_EQ(folders.size(), 1u);
    EXPECT_EQ(folders[0].name(), "docs");

    fs.createFile("docs/a.txt").writeAll("hello");
    EXPECT_EQ(fs.getFolderSize("docs"), 5);

    fs.renameFolder("docs", "files");
    EXPECT_TRUE(fs.fileExists("files/a.txt"));
    EXPECT_FALSE(fs.fileExists("docs/a.txt"));
}

TEST_F(BlobFileSystemTest, OperationDepthReturnsToZero) {
    auto fs = makeFileSystem();

    EXPECT_THROW(fs.getFile("missing.txt"), NotFoundError);
    fs.createFolder("docs");
    fs.renameFolder("docs", "files");

    EXPECT_EQ(fs.activeOperations(), 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
