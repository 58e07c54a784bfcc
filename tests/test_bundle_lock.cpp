#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include "BundleLock.h"
#include "Errors.h"
#include "FakeBinary.h"
#include "Utils.h"

using namespace dylibembed;

TEST(BundleLock, LockFileSitsBesideEmbeddingDirectory)
{
    EXPECT_EQ("/b/App.app/Contents/MacOS/.lib-arm64-14.2.lock",
              BundleLock::pathFor("/b/App.app/Contents/MacOS/lib-arm64-14.2"));
    EXPECT_EQ("/b/MacOS/.lib.lock", BundleLock::pathFor("/b/MacOS/lib/"));
}

TEST(BundleLock, SecondHolderIsRejected)
{
    fakes::TempDir tmp;
    const std::string path = tmp.sub(".lib.lock");

    BundleLock first(path);
    EXPECT_THROW(BundleLock second(path), PreconditionError);
}

TEST(BundleLock, ReleasedAndRemovedOnDestruction)
{
    fakes::TempDir tmp;
    const std::string path = tmp.sub(".lib.lock");

    {
        BundleLock lock(path);
        EXPECT_TRUE(fileExists(path));
    }
    EXPECT_FALSE(fileExists(path));

    BundleLock again(path);
}

TEST(BundleLock, UnwritableLocation)
{
    EXPECT_THROW(BundleLock("/nonexistent/dylibembed/.lib.lock"),
                 PreconditionError);
}

TEST(BundleLock, DetectsReplacedLockFile)
{
    fakes::TempDir tmp;
    const std::string path = tmp.sub(".lib.lock");
    fakes::writeBinary(path, "", std::vector<std::string>());

    const int fd = open(path.c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(sameFile(fd, path));

    unlink(path.c_str());
    EXPECT_FALSE(sameFile(fd, path));

    fakes::writeBinary(path, "", std::vector<std::string>());
    EXPECT_FALSE(sameFile(fd, path));
    close(fd);

    BundleLock lock(path);
}
