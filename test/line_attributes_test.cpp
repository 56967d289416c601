#include "posix_term/line_attributes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using posix_term::LineAttributes;

TEST(line_attributes, standard_rates_translate)
{
    const int rates[] = {50, 300, 1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200, 230400};
    for (int baud : rates)
    {
        auto spd = posix_term::baud_to_speed(baud);
        ASSERT_TRUE(spd.has_value()) << baud;
        EXPECT_EQ(posix_term::speed_to_baud(*spd), baud);
    }
    EXPECT_EQ(*posix_term::baud_to_speed(9600), static_cast<speed_t>(B9600));
}

TEST(line_attributes, unsupported_rates_rejected)
{
    EXPECT_FALSE(posix_term::baud_to_speed(-9600).has_value());
    EXPECT_FALSE(posix_term::baud_to_speed(-1).has_value());
    EXPECT_FALSE(posix_term::baud_to_speed(9601).has_value());
    EXPECT_FALSE(posix_term::baud_to_speed(123456).has_value());
}

TEST(line_attributes, set_speed_updates_both_directions)
{
    LineAttributes a;
    ASSERT_TRUE(a.set_speed(19200));
    EXPECT_EQ(a.input_speed(), 19200);
    EXPECT_EQ(a.output_speed(), 19200);

    termios native = a.to_native();
    EXPECT_EQ(cfgetospeed(&native), static_cast<speed_t>(B19200));
}

TEST(line_attributes, failed_set_speed_changes_nothing)
{
    LineAttributes a;
    ASSERT_TRUE(a.set_speed(4800));
    EXPECT_FALSE(a.set_speed(-5));
    EXPECT_EQ(a.output_speed(), 4800);
}

TEST(line_attributes, native_fields_carried_through)
{
    termios native{};
    native.c_iflag = IGNPAR;
    native.c_cflag = CS7 | PARENB;
    native.c_cc[VEOF] = 4;

    LineAttributes a = LineAttributes::from_native(native);
    EXPECT_EQ(a.input_flags(), static_cast<tcflag_t>(IGNPAR));
    EXPECT_EQ(a.control_char(VEOF), 4);

    ASSERT_TRUE(a.set_speed(9600));
    termios back = a.to_native();
    EXPECT_EQ(back.c_iflag, native.c_iflag);
    EXPECT_EQ(back.c_cflag & (CSIZE | PARENB), static_cast<tcflag_t>(CS7 | PARENB));
    EXPECT_EQ(back.c_cc[VEOF], 4);
}

TEST(line_attributes, make_raw)
{
    LineAttributes a;
    a.set_local_flags(ICANON | ECHO | ISIG);
    a.make_raw();
    EXPECT_EQ(a.local_flags() & (ICANON | ECHO | ISIG), 0u);
    EXPECT_EQ(a.control_flags() & CSIZE, static_cast<tcflag_t>(CS8));
    EXPECT_NE(a.control_flags() & CREAD, 0u);
    EXPECT_NE(a.control_flags() & CLOCAL, 0u);
}

TEST(line_attributes, read_timeout_encoding)
{
    LineAttributes a;
    a.set_read_timeout(std::chrono::milliseconds(250));
    EXPECT_EQ(a.control_char(VMIN), 0);
    EXPECT_EQ(a.control_char(VTIME), 3);

    a.set_read_timeout(std::chrono::milliseconds(100));
    EXPECT_EQ(a.control_char(VTIME), 1);

    a.set_read_timeout(std::chrono::seconds(60));
    EXPECT_EQ(a.control_char(VTIME), 255);

    a.set_read_timeout(std::chrono::milliseconds(0));
    EXPECT_EQ(a.control_char(VMIN), 1);
    EXPECT_EQ(a.control_char(VTIME), 0);
}

TEST(line_attributes, control_char_bounds)
{
    LineAttributes a;
    EXPECT_THROW(a.control_char(NCCS), std::out_of_range);
    EXPECT_THROW(a.set_control_char(NCCS, 0), std::out_of_range);
}
