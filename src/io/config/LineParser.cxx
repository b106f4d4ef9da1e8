// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <string>

#include <string.h>

void
LineParser::ExpectEnd()
{
	Strip();

	if (!IsEnd() && front() != '#')
		throw Error(std::string{"Unexpected tokens at end of line: "} + p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;
	while (*word != 0)
		if (*q++ != *word++)
			return false;

	if (IsWordChar(*q))
		/* the word in the line is longer */
		return false;

	p = StripLeft(q);
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *const value = p;
	while (IsUnquotedChar(front()))
		++p;

	if (p == value)
		return nullptr;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return value;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = StripLeft(end + 1);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return NextUnquotedValue();

	char *const value = ++p;
	char *dest = value;

	while (true) {
		char ch = *p;
		if (ch == 0)
			/* unterminated string */
			return nullptr;

		++p;

		if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		}

		if (ch == '\\' && stop == '"') {
			ch = *p;
			if (ch == 0)
				return nullptr;

			++p;
		}

		*dest++ = ch;
	}
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
