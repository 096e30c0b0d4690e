/*
 * scanner.h
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

#ifndef SCANNER_H
#define SCANNER_H

#include <QObject>

#include "isdb/isdbchannel.h"

class QCommandLineParser;

class Scanner : public QObject
{
	Q_OBJECT
public:
	explicit Scanner(QCommandLineParser *parser_);
	~Scanner();

	static void addOptions(QCommandLineParser *parser);

	// returns the exit code of the application
	int run();

private slots:
	void scanProgress(int scannedChannels, int totalChannels);
	void foundTransportStreams(const QList<IsdbTransportStreamInfo> &transportStreams);

private:
	QCommandLineParser *parser;
};

#endif /* SCANNER_H */
