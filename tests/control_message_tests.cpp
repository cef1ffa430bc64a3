/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <util.h>

// ============================================================================
// Constructors
// ============================================================================

TEST(ControlMessage, DefaultConstructor)
{
    ControlMessage msg;
    EXPECT_EQ(msg.m_timestamp, 0);
    EXPECT_EQ(msg.m_command, ControlMessage::UNKNOWN);
}

TEST(ControlMessage, ParameterizedConstructor)
{
    int64_t ts = GetUnixEpochTime();
    ControlMessage msg(ts, ControlMessage::TOGGLE);

    EXPECT_EQ(msg.m_timestamp, ts);
    EXPECT_EQ(msg.m_command, ControlMessage::TOGGLE);
}

TEST(ControlMessage, StringConstructor)
{
    ControlMessage msg("1000000000", "AUTOSTART_OFF");

    EXPECT_EQ(msg.m_timestamp, 1000000000);
    EXPECT_EQ(msg.m_command, ControlMessage::AUTOSTART_OFF);
}

TEST(ControlMessage, StringConstructorUnknownCommand)
{
    ControlMessage msg("1000000000", "SUSPEND");
    EXPECT_EQ(msg.m_command, ControlMessage::UNKNOWN);
}

TEST(ControlMessage, StringConstructorInvalidTimestamp)
{
    EXPECT_THROW(ControlMessage("not_a_number", "ENABLE"), std::invalid_argument);
}

// ============================================================================
// Command names
// ============================================================================

TEST(ControlMessage, CommandToStringStatic)
{
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::UNKNOWN), "UNKNOWN");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::ENABLE), "ENABLE");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::DISABLE), "DISABLE");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::TOGGLE), "TOGGLE");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::AUTOSTART_ON), "AUTOSTART_ON");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::AUTOSTART_OFF), "AUTOSTART_OFF");
    EXPECT_EQ(ControlMessage::CommandToString(ControlMessage::QUIT), "QUIT");
}

TEST(ControlMessage, CommandToStringMember)
{
    ControlMessage msg(0, ControlMessage::DISABLE);
    EXPECT_EQ(msg.CommandToString(), "DISABLE");
}

TEST(ControlMessage, CommandStringToEnumAcceptsCliSpelling)
{
    EXPECT_EQ(ControlMessage::CommandStringToEnum("enable"), ControlMessage::ENABLE);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("Disable"), ControlMessage::DISABLE);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("toggle"), ControlMessage::TOGGLE);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("autostart-on"), ControlMessage::AUTOSTART_ON);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("autostart_off"), ControlMessage::AUTOSTART_OFF);
    EXPECT_EQ(ControlMessage::CommandStringToEnum(" quit "), ControlMessage::QUIT);
}

TEST(ControlMessage, CommandStringToEnumUnknown)
{
    EXPECT_EQ(ControlMessage::CommandStringToEnum(""), ControlMessage::UNKNOWN);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("status"), ControlMessage::UNKNOWN);
    EXPECT_EQ(ControlMessage::CommandStringToEnum("enabled"), ControlMessage::UNKNOWN);
}

// ============================================================================
// IsValid
// ============================================================================

TEST(ControlMessage, IsValidWithCurrentTimestamp)
{
    ControlMessage msg(GetUnixEpochTime(), ControlMessage::ENABLE);
    EXPECT_TRUE(msg.IsValid());
}

TEST(ControlMessage, IsInvalidWithUnknownCommand)
{
    ControlMessage msg(GetUnixEpochTime(), ControlMessage::UNKNOWN);
    EXPECT_FALSE(msg.IsValid());
}

TEST(ControlMessage, IsInvalidWhenStale)
{
    ControlMessage msg(GetUnixEpochTime() - 2 * 86400, ControlMessage::ENABLE);
    EXPECT_FALSE(msg.IsValid());
}

TEST(ControlMessage, IsInvalidFromFuture)
{
    ControlMessage msg(GetUnixEpochTime() + 3600, ControlMessage::ENABLE);
    EXPECT_FALSE(msg.IsValid());
}

TEST(ControlMessage, IsInvalidDefault)
{
    ControlMessage msg;
    EXPECT_FALSE(msg.IsValid());
}

// ============================================================================
// ToString and Parse
// ============================================================================

TEST(ControlMessage, ToStringFormat)
{
    ControlMessage msg(1000000000, ControlMessage::AUTOSTART_ON);
    EXPECT_EQ(msg.ToString(), "1000000000:AUTOSTART_ON");
}

TEST(ControlMessage, ParseWellFormedLine)
{
    std::optional<ControlMessage> msg = ControlMessage::Parse("1700000000:TOGGLE\n");

    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->m_timestamp, 1700000000);
    EXPECT_EQ(msg->m_command, ControlMessage::TOGGLE);
}

TEST(ControlMessage, ParseWhatPepctlSends)
{
    ControlMessage sent(GetUnixEpochTime(), ControlMessage::QUIT);

    std::optional<ControlMessage> received = ControlMessage::Parse(sent.ToString());

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->m_timestamp, sent.m_timestamp);
    EXPECT_EQ(received->m_command, ControlMessage::QUIT);
    EXPECT_TRUE(received->IsValid());
}

TEST(ControlMessage, ParseUnknownCommandIsParsedButInvalid)
{
    std::optional<ControlMessage> msg = ControlMessage::Parse(ToString(GetUnixEpochTime()) + ":REBOOT");

    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->m_command, ControlMessage::UNKNOWN);
    EXPECT_FALSE(msg->IsValid());
}

TEST(ControlMessage, ParseMalformed)
{
    EXPECT_FALSE(ControlMessage::Parse("").has_value());
    EXPECT_FALSE(ControlMessage::Parse("ENABLE").has_value());
    EXPECT_FALSE(ControlMessage::Parse("1:2:ENABLE").has_value());
    EXPECT_FALSE(ControlMessage::Parse("now:ENABLE").has_value());
    EXPECT_FALSE(ControlMessage::Parse("99999999999999999999999:ENABLE").has_value());
}
