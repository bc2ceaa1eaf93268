#include <gtest/gtest.h>

#include <tabweave/commands.hpp>
#include <tabweave/status.hpp>
#include <tabweave/tab_state.hpp>

using namespace tabweave;

TEST(Status, SuccessIsOk)
{
    Status st = Status::success();
    EXPECT_TRUE(st.ok());
    EXPECT_TRUE(static_cast<bool>(st));
    EXPECT_EQ(st.to_string(), "Ok");
}

TEST(Status, ErrorCarriesCodeAndMessage)
{
    Status st = Status::error(ErrorCode::NotFound, "tab 7 is unknown");
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.code, ErrorCode::NotFound);
    EXPECT_EQ(st.cause, ErrorCode::Ok);
    EXPECT_EQ(st.to_string(), "NotFound: tab 7 is unknown");
}

TEST(Status, TransferFailedKeepsCause)
{
    Status original = Status::error(ErrorCode::ResourceExhausted, "no more surfaces");
    Status st       = Status::transfer_failed(original);
    EXPECT_EQ(st.code, ErrorCode::TransferFailed);
    EXPECT_EQ(st.cause, ErrorCode::ResourceExhausted);
    EXPECT_EQ(st.message, "no more surfaces");
    EXPECT_EQ(st.to_string(), "TransferFailed (cause: ResourceExhausted): no more surfaces");
}

TEST(Status, ErrorCodeNames)
{
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidWindow), "InvalidWindow");
    EXPECT_STREQ(error_code_name(ErrorCode::NoSuchSurface), "NoSuchSurface");
    EXPECT_STREQ(error_code_name(ErrorCode::Unsupported), "Unsupported");
    EXPECT_STREQ(error_code_name(static_cast<ErrorCode>(42)), "Unknown");
}

TEST(Status, ErrorCodeWireValues)
{
    EXPECT_EQ(static_cast<int>(ErrorCode::InvalidWindow), 1);
    EXPECT_EQ(static_cast<int>(ErrorCode::NotFound), 2);
    EXPECT_EQ(static_cast<int>(ErrorCode::ResourceExhausted), 3);
    EXPECT_EQ(static_cast<int>(ErrorCode::NoSuchSurface), 4);
    EXPECT_EQ(static_cast<int>(ErrorCode::TransferFailed), 5);
}

TEST(CommandNames, EveryCommandIsNamed)
{
    EXPECT_STREQ(command_name(CreateTab{}), "CreateTab");
    EXPECT_STREQ(command_name(CloseTab{}), "CloseTab");
    EXPECT_STREQ(command_name(TransferTab{}), "TransferTab");
    EXPECT_STREQ(command_name(RequestFocus{}), "RequestFocus");
}

TEST(SurfaceStateNames, Names)
{
    EXPECT_STREQ(surface_state_name(SurfaceState::Uninitialized), "Uninitialized");
    EXPECT_STREQ(surface_state_name(SurfaceState::Live), "Live");
    EXPECT_STREQ(surface_state_name(SurfaceState::Frozen), "Frozen");
}
