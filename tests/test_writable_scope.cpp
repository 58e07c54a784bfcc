#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/stat.h>

#include "Errors.h"
#include "FakeBinary.h"
#include "WritableScope.h"

using namespace dylibembed;

class WritableScopeTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        lib = tmp.sub("libA.dylib");
        fakes::writeBinary(lib, "/src/libA.dylib",
                           std::vector<std::string>(1, "/src/libB.dylib"));
        chmod(lib.c_str(), 0444);
    }

    fakes::TempDir tmp;
    std::string lib;
};

TEST_F(WritableScopeTest, WidensThenRestores)
{
    mode_t inside = 0;
    withWritable(lib, [&]() { inside = fakes::fileMode(lib); });

    EXPECT_TRUE(inside & S_IWUSR);
    EXPECT_TRUE(inside & S_IWGRP);
    EXPECT_EQ(0444u, fakes::fileMode(lib));
}

TEST_F(WritableScopeTest, RestoresWhenMutationThrows)
{
    EXPECT_THROW(withWritable(lib,
                              []() { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_EQ(0444u, fakes::fileMode(lib));
}

TEST_F(WritableScopeTest, MissingFileFailsBeforeMutation)
{
    bool called = false;
    EXPECT_THROW(withWritable(tmp.sub("missing.dylib"),
                              [&]() { called = true; }),
                 RewriteError);
    EXPECT_FALSE(called);
}

TEST_F(WritableScopeTest, KeepsAlreadyWritableMode)
{
    chmod(lib.c_str(), 0755);
    {
        WritableScope scope(lib);
        EXPECT_EQ(0755u, scope.originalMode());
    }
    EXPECT_EQ(0755u, fakes::fileMode(lib));
}

TEST_F(WritableScopeTest, RewriterRestoresPermissionsOnSuccess)
{
    fakes::FakeRewriter rewriter;
    rewriter.rewriteDependency(lib, "/src/libB.dylib",
                               "@executable_path/lib-x/libB.dylib");

    EXPECT_TRUE(rewriter.mode_seen & S_IWUSR);
    EXPECT_EQ(0444u, fakes::fileMode(lib));
    EXPECT_EQ("@executable_path/lib-x/libB.dylib", fakes::readDeps(lib)[0]);
}

TEST_F(WritableScopeTest, RewriterRestoresPermissionsOnFailure)
{
    fakes::FakeRewriter rewriter;
    rewriter.fail = true;

    EXPECT_THROW(rewriter.rewriteSelfIdentity(lib, "@executable_path/x"),
                 RewriteError);
    EXPECT_EQ(0444u, fakes::fileMode(lib));

    EXPECT_THROW(rewriter.rewriteDependency(lib, "/src/libB.dylib",
                                            "@executable_path/x"),
                 RewriteError);
    EXPECT_EQ(0444u, fakes::fileMode(lib));
}

TEST_F(WritableScopeTest, RewriteOfAbsentReferenceIsNoOp)
{
    const std::string before = fakes::readFile(lib);

    fakes::FakeRewriter rewriter;
    rewriter.rewriteDependency(lib, "/src/libNotThere.dylib",
                               "@executable_path/lib-x/libNotThere.dylib");

    EXPECT_EQ(before, fakes::readFile(lib));
}
