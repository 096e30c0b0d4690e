/*
 * main.cpp
 *
 * Copyright (C) 2007-2011 Christoph Pfister <christophpfister@gmail.com>
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

#include "log.h"

#include <KAboutData>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <config-isdbscanner.h>

#include "scanner.h"

int main(int argc, char *argv[])
{
	qInstallMessageHandler(Log::messageHandler);

	KLocalizedString::setApplicationDomain("isdbscanner");

	QCoreApplication app(argc, argv);

	KAboutData aboutData(
		// Program name
		QStringLiteral("isdbscanner"),
		i18n("ISDBScanner"),
		// Version
		QStringLiteral(ISDBSCANNER_VERSION),
		// Short description
		i18n("Scans the ISDB-T and ISDB-S channels receivable by the tuners."),
		// License
		KAboutLicense::GPL_V2,
		// Copyright statement
		i18n("(C) 2023 The ISDBScanner Authors"));

	KAboutData::setApplicationData(aboutData);

	QCommandLineParser parser;
	parser.addVersionOption();
	parser.addHelpOption();
	aboutData.setupCommandLine(&parser);
	Scanner::addOptions(&parser);

	parser.process(app);

	aboutData.processCommandLine(&parser);

	Scanner scanner(&parser);
	return scanner.run();
}
