/*
 * log.cpp
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

#include <QDateTime>
#include <QRegularExpression>

#include <iostream>

extern "C" {
  #include <unistd.h>
  #include <string.h>
}

Q_LOGGING_CATEGORY(logConfig, "isdbscanner.config")
Q_LOGGING_CATEGORY(logDev, "isdbscanner.dev")
Q_LOGGING_CATEGORY(logIsdbSi, "isdbscanner.si")
Q_LOGGING_CATEGORY(logScan, "isdbscanner.scan")
Q_LOGGING_CATEGORY(logTuner, "isdbscanner.tuner")

void Log::enableDebug(bool enable)
{
	if (enable) {
		QLoggingCategory::defaultCategory()->setEnabled(QtDebugMsg, true);
		QLoggingCategory::setFilterRules(QStringLiteral("isdbscanner.*.debug=true"));
	} else {
		QLoggingCategory::setFilterRules(QStringLiteral("isdbscanner.*.debug=false"));
	}
}

void Log::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
	static const QString typeStr[] = {
		"[Debug   ] ",
		"[Warning ] ",
		"[Critical] ",
		"[Fatal   ] ",
		"[Info    ] "};
	static const QString color[] {
		"\x1b[0;32m",	// Debug
		"\x1b[0;33m",	// Warning
		"\x1b[0;31m",	// Critical
		"\x1b[1;31m",	// Fatal
		"\x1b[0;37m"};	// Info
	QString contextString, file = context.file;
	QByteArray localMsg = msg.toLocal8Bit();
	QString log;
	bool tty = isatty(STDERR_FILENO);

	file.remove(QRegularExpression(".*/src/"));

	if (context.line && QLoggingCategory::defaultCategory()->isEnabled(QtDebugMsg))
		contextString = QStringLiteral("%1#%2: %3: ")
						.arg(file)
						.arg(context.line)
						.arg(context.function);

	QString timeStr(QDateTime::currentDateTime().toString("dd-MM-yy HH:mm:ss.zzz "));

	log.append(timeStr);
	if (type <= 4)
		log.append(typeStr[type]);

	if (tty && (type <= 4)) {
		if (context.category && strcmp(context.category, "default"))
			log.append(QStringLiteral("\x1b[1;37m%1:\x1b[0;37m ") .arg(context.category));
		std::cerr << color[type].toLocal8Bit().constData();
	} else {
		if (context.category && strcmp(context.category, "default"))
			log.append(QStringLiteral("%1: ") .arg(context.category));
	}
	std::cerr << log.toLocal8Bit().constData();

	if (!contextString.isEmpty()) {
		if (tty)
			std::cerr << "\x1b[0;33m";
		std::cerr << contextString.toLocal8Bit().constData();
	}

	if (tty)
		std::cerr << "\x1b[0m";

	std::cerr << localMsg.constData() << "\n";

	if (type == QtFatalMsg)
		abort();
}
