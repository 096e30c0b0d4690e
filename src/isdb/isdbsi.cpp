/*
 * isdbsi.cpp
 *
 * Copyright (C) 2023 The ISDBScanner Authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include "../log.h"

#include <QTextCodec>

#include "isdbsi.h"

// graphic sets (final bytes of the designation sequences)
enum GraphicSet
{
	Hiragana		= 0x30,
	Katakana		= 0x31,
	MosaicA			= 0x32,
	MosaicB			= 0x33,
	MosaicC			= 0x34,
	MosaicD			= 0x35,
	ProportionalAlnum	= 0x36,
	ProportionalHiragana	= 0x37,
	ProportionalKatakana	= 0x38,
	JisCompatibleKanji1	= 0x39,
	JisCompatibleKanji2	= 0x3a,
	AdditionalSymbols	= 0x3b,
	Kanji			= 0x42,
	JisX0201Katakana	= 0x49,
	Alphanumeric		= 0x4a,
	Drcs			= 0x100 // or'ed with the final byte
};

// one glyph that can not be represented
static const ushort getaMark = 0x3013;

static int bytesPerCharacter(int set)
{
	switch (set) {
	case Kanji:
	case JisCompatibleKanji1:
	case JisCompatibleKanji2:
	case AdditionalSymbols:
	case (Drcs | 0x40):
		return 2;
	}

	return 1;
}

// symbols 0x77 - 0x7e shared by the hiragana and katakana sets
static const ushort kanaSymbols[] = { 0x309d, 0x309e, 0x30fc, 0x3002, 0x300c, 0x300d, 0x3001, 0x30fb };

class IsdbAribDecoder
{
public:
	explicit IsdbAribDecoder(QTextCodec *codec_) : codec(codec_)
	{
		g[0] = Kanji;
		g[1] = Alphanumeric;
		g[2] = Hiragana;
		g[3] = Katakana;
		gl = 0;
		gr = 2;
	}

	QString decode(const unsigned char *data, int size);

private:
	int designation(const unsigned char *data, int size);
	void appendCharacter(int set, const unsigned char *data);
	int controlParameters(const unsigned char *data, int size);

	QTextCodec *codec;
	int g[4];
	int gl;
	int gr;
	QString result;
};

QString IsdbAribDecoder::decode(const unsigned char *data, int size)
{
	int i = 0;

	while (i < size) {
		unsigned char c = data[i];

		if ((c >= 0x21) && (c <= 0x7e)) {
			int set = g[gl];
			int length = bytesPerCharacter(set);

			if (i + length > size) {
				break;
			}

			appendCharacter(set, data + i);
			i += length;
			continue;
		}

		if ((c >= 0xa1) && (c <= 0xfe)) {
			int set = g[gr];
			int length = bytesPerCharacter(set);

			if (i + length > size) {
				break;
			}

			unsigned char buffer[2] = { static_cast<unsigned char>(c & 0x7f), 0 };

			if (length == 2) {
				buffer[1] = (data[i + 1] & 0x7f);
			}

			appendCharacter(set, buffer);
			i += length;
			continue;
		}

		++i;

		switch (c) {
		case 0x0d: // APR
			result.append(QLatin1Char('\n'));
			break;
		case 0x0e: // LS1
			gl = 1;
			break;
		case 0x0f: // LS0
			gl = 0;
			break;
		case 0x19: // SS2
		case 0x1d: { // SS3
			int set = g[(c == 0x19) ? 2 : 3];
			int length = bytesPerCharacter(set);

			if (i + length > size) {
				i = size;
				break;
			}

			unsigned char buffer[2] = { static_cast<unsigned char>(data[i] & 0x7f), 0 };

			if (length == 2) {
				buffer[1] = (data[i + 1] & 0x7f);
			}

			appendCharacter(set, buffer);
			i += length;
			break;
		    }
		case 0x1b: // ESC
			i += designation(data + i, size - i);
			break;
		case 0x20: // SP
		case 0xa0:
			if (bytesPerCharacter(g[gl]) == 2) {
				result.append(QChar(0x3000));
			} else {
				result.append(QLatin1Char(' '));
			}

			break;
		default:
			i += controlParameters(data + i, size - i);
			break;
		}
	}

	return result;
}

// returns the number of bytes consumed after ESC
int IsdbAribDecoder::designation(const unsigned char *data, int size)
{
	if (size < 1) {
		return 0;
	}

	switch (data[0]) {
	case 0x6e: // LS2
		gl = 2;
		return 1;
	case 0x6f: // LS3
		gl = 3;
		return 1;
	case 0x7e: // LS1R
		gr = 1;
		return 1;
	case 0x7d: // LS2R
		gr = 2;
		return 1;
	case 0x7c: // LS3R
		gr = 3;
		return 1;
	}

	if ((data[0] >= 0x28) && (data[0] <= 0x2b)) {
		// 1-byte G set or DRCS into G0 - G3
		int index = data[0] - 0x28;

		if ((size >= 3) && (data[1] == 0x20)) {
			g[index] = (Drcs | data[2]);
			return 3;
		}

		if (size >= 2) {
			g[index] = data[1];
			return 2;
		}

		return size;
	}

	if (data[0] == 0x24) {
		// 2-byte G set or DRCS
		if (size < 2) {
			return size;
		}

		if ((data[1] >= 0x28) && (data[1] <= 0x2b)) {
			int index = data[1] - 0x28;

			if ((size >= 4) && (data[2] == 0x20)) {
				g[index] = (Drcs | data[3]);
				return 4;
			}

			if (size >= 3) {
				g[index] = data[2];
				return 3;
			}

			return size;
		}

		g[0] = data[1];
		return 2;
	}

	qCDebug(logIsdbSi, "Unknown escape sequence 0x%02x", data[0]);
	return 1;
}

// skips the parameters of C0 / C1 control codes
int IsdbAribDecoder::controlParameters(const unsigned char *data, int size)
{
	int skip = 0;

	switch (data[-1]) {
	case 0x16: // PAPF
	case 0x8b: // SZX
	case 0x91: // FLC
	case 0x93: // POL
	case 0x94: // WMM
	case 0x97: // HLC
	case 0x98: // RPC
		skip = 1;
		break;
	case 0x1c: // APS
	case 0x9d: // TIME
		skip = 2;
		break;
	case 0x90: // COL
	case 0x92: // CDC
		skip = ((size >= 1) && (data[0] == 0x20)) ? 2 : 1;
		break;
	case 0x95: // MACRO
		while ((skip + 1 < size) && !((data[skip] == 0x95) && (data[skip + 1] == 0x4f))) {
			++skip;
		}

		skip += 2;
		break;
	case 0x9b: // CSI
		while ((skip < size) && !((data[skip] >= 0x40) && (data[skip] <= 0x6f))) {
			++skip;
		}

		++skip;
		break;
	}

	return qMin(skip, size);
}

void IsdbAribDecoder::appendCharacter(int set, const unsigned char *data)
{
	unsigned char c = data[0];

	switch (set) {
	case Kanji:
	case JisCompatibleKanji1:
		if (c >= 0x7a) {
			// rows 90 - 94 are ARIB additional symbols
			result.append(QChar(getaMark));
		} else if (codec != NULL) {
			char buffer[2] = { static_cast<char>(c | 0x80), static_cast<char>(data[1] | 0x80) };
			result.append(codec->toUnicode(buffer, 2));
		} else {
			result.append(QChar(getaMark));
		}

		return;
	case Alphanumeric:
	case ProportionalAlnum:
		if (c == 0x5c) {
			result.append(QChar(0x00a5));
		} else if (c == 0x7e) {
			result.append(QChar(0x203e));
		} else {
			result.append(QLatin1Char(c));
		}

		return;
	case Hiragana:
	case ProportionalHiragana:
		if (c <= 0x73) {
			result.append(QChar(0x3041 + c - 0x21));
		} else if (c >= 0x77) {
			result.append(QChar(kanaSymbols[c - 0x77]));
		} else {
			result.append(QChar(0x3000));
		}

		return;
	case Katakana:
	case ProportionalKatakana:
		if (c <= 0x76) {
			result.append(QChar(0x30a1 + c - 0x21));
		} else if (c == 0x77) {
			result.append(QChar(0x30fd));
		} else if (c == 0x78) {
			result.append(QChar(0x30fe));
		} else {
			result.append(QChar(kanaSymbols[c - 0x77]));
		}

		return;
	case JisX0201Katakana:
		if (c <= 0x5f) {
			result.append(QChar(0xff61 + c - 0x21));
		}

		return;
	case MosaicA:
	case MosaicB:
	case MosaicC:
	case MosaicD:
		return;
	}

	// jis plane 2, additional symbols and drcs
	result.append(QChar(getaMark));
}

QTextCodec *IsdbSiText::eucJpCodec()
{
	static QTextCodec *codec = NULL;

	if (codec == NULL) {
		codec = QTextCodec::codecForName("EUC-JP");

		if (codec == NULL) {
			qCWarning(logIsdbSi, "EUC-JP codec not available, kanji can not be decoded");
		}
	}

	return codec;
}

QString IsdbSiText::convertText(const char *data, int size)
{
	IsdbAribDecoder decoder(eucJpCodec());
	return decoder.decode(reinterpret_cast<const unsigned char *>(data), size);
}

QString IsdbSiText::normalize(const QString &text)
{
	QString result = text;

	for (int i = 0; i < result.size(); ++i) {
		ushort unicode = result.at(i).unicode();

		if ((unicode >= 0xff01) && (unicode <= 0xff5e)) {
			unicode -= 0xfee0;
		} else if (unicode == 0x3000) {
			unicode = 0x0020;
		}

		switch (unicode) {
		case '!':
		case '?':
		case '*':
		case '~':
		case '@':
			unicode += 0xfee0;
			break;
		case 0x301c:
			unicode = 0xff5e;
			break;
		}

		result[i] = QChar(unicode);
	}

	return result;
}
