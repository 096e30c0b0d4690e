/*
 * isdbtunermanager.h
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

#ifndef ISDBTUNERMANAGER_H
#define ISDBTUNERMANAGER_H

#include <QList>
#include <QStringList>

#include "isdbtuner.h"

class IsdbProcessFactory;

class IsdbTunerManager
{
public:
	explicit IsdbTunerManager(IsdbProcessFactory *processFactory_);
	~IsdbTunerManager();

	// looks for chardev tuners first, then for v4l-dvb frontends
	void scanDevices();

	// ownership stays with the manager
	void addTuner(IsdbTuner *tuner);

	QList<IsdbTuner *> getTerrestrialOnlyTuners() const
	{
		return terrestrialOnlyTuners;
	}

	QList<IsdbTuner *> getSatelliteOnlyTuners() const
	{
		return satelliteOnlyTuners;
	}

	QList<IsdbTuner *> getMultiTuners() const
	{
		return multiTuners;
	}

	// terrestrial only tuners followed by multi tuners
	QList<IsdbTuner *> getTerrestrialTuners() const
	{
		return terrestrialOnlyTuners + multiTuners;
	}

	QList<IsdbTuner *> getSatelliteTuners() const
	{
		return satelliteOnlyTuners + multiTuners;
	}

	/*
	 * type and name of a chardev tuner from its device path;
	 * returns false for unknown paths
	 */
	static bool chardevTunerInfo(const QString &devicePath, IsdbTuner::TunerType *type,
		QString *name);

	// pt1 / pt3 / px4 numbering: 0, 1 satellite, 2, 3 terrestrial, ...
	static void pt1Pt3Px4TunerInfo(int deviceNumber, IsdbTuner::TunerType *type,
		int *tunerNumber);

	// known pci and usb ids, otherwise defaultName
	static QString dvbTunerName(const QString &sysfsPath, IsdbTuner::TunerType type,
		const QString &defaultName);

	// appends " #1", " #2", ... to the names, counting per distinct name
	static void numberTunerNames(QStringList *names);

	static QStringList terrestrialOnlyDevicePaths();
	static QStringList satelliteOnlyDevicePaths();
	static QStringList multiDevicePaths();

private:
	Q_DISABLE_COPY(IsdbTunerManager)

	static bool isCharDevice(const QString &path);
	static int readSysAttr(const QString &path);
	static QString px4ModelNames();

	void addChardevTuners(const QStringList &devicePaths);
	void addDvbTuners();

	IsdbProcessFactory *processFactory;
	QList<IsdbTuner *> terrestrialOnlyTuners;
	QList<IsdbTuner *> satelliteOnlyTuners;
	QList<IsdbTuner *> multiTuners;
};

#endif /* ISDBTUNERMANAGER_H */
