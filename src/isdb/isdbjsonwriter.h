/*
 * isdbjsonwriter.h
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

#ifndef ISDBJSONWRITER_H
#define ISDBJSONWRITER_H

#include <QJsonArray>
#include <QJsonObject>

#include "isdbchannel.h"

class IsdbJsonWriter
{
public:
	IsdbJsonWriter() { }
	~IsdbJsonWriter() { }

	/*
	 * the document has the lists "Terrestrial", "BS" and "CS"; absent
	 * optional fields are written as null
	 */
	static QByteArray toJson(const IsdbScanResult &result);

	static bool write(const IsdbScanResult &result, const QString &fileName,
		QString *errorString);

	static QJsonObject transportStreamObject(const IsdbTransportStreamInfo &transportStream);
	static QJsonObject serviceObject(const IsdbServiceInfo &service);

private:
	static QJsonArray transportStreamArray(const QList<IsdbTransportStreamInfo> &transportStreams);
};

#endif /* ISDBJSONWRITER_H */
