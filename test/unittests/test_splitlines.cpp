//    vpngw -- A VPN gateway that relays OpenVPN peers through an
//             upstream WireGuard tunnel.
//
//    Copyright (C) 2012-2017 OpenVPN Inc.
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU Affero General Public License Version 3
//    as published by the Free Software Foundation.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU Affero General Public License for more details.
//
//    You should have received a copy of the GNU Affero General Public License
//    along with this program in the COPYING file.
//    If not, see <http://www.gnu.org/licenses/>.

#include "test_helper.hpp"

#include <vpngw/common/splitlines.hpp>

using namespace vpngw;

const std::string short_text = "Lorem\nipsum\r\ndolor\n\r\nsit";
const std::vector<std::string> short_lines{"Lorem\n", "ipsum\r\n", "dolor\n", "\r\n", "sit"};
const std::vector<std::string> short_lines_trim{"Lorem", "ipsum", "dolor", "", "sit"};

TEST(SplitLines, NoMaxLengthNoTrim)
{
  SplitLines in(short_text, 0);
  size_t index = 0;
  while (in(false))
    {
      ASSERT_EQ(in.line_ref(), short_lines[index++]);
    }
  ASSERT_EQ(index, short_lines.size());
}

TEST(SplitLines, NoMaxLengthTrim)
{
  SplitLines in(short_text, 0);
  size_t index = 0;
  while (in(true))
    {
      ASSERT_FALSE(in.line_overflow());
      ASSERT_EQ(in.line_ref(), short_lines_trim[index++]);
    }
  ASSERT_EQ(index, short_lines_trim.size());
}

TEST(SplitLines, MaxLength)
{
  SplitLines in(short_text, 24);
  size_t index = 0;
  while (in(true))
    {
      ASSERT_FALSE(in.line_overflow());
      ASSERT_EQ(in.line_ref(), short_lines_trim[index++]);
    }
}

TEST(SplitLines, MaxLengthOverflow)
{
  SplitLines in(short_text, 2);
  ASSERT_TRUE(in());
  ASSERT_TRUE(in.line_overflow());
  ASSERT_THROW(in.line_ref(), SplitLines::splitlines_overflow_error);
}

TEST(SplitLines, MovedError)
{
  SplitLines in(short_text, 0);
  ASSERT_TRUE(in());
  std::string line = in.line_move();
  ASSERT_EQ(line, short_lines_trim[0]);
  ASSERT_THROW(in.line_ref(), SplitLines::splitlines_moved_error);
}
