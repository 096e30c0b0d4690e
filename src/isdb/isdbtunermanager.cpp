/*
 * isdbtunermanager.cpp
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

#include "../log.h"

#include <QDir>
#include <QFile>
#include <QMap>
#include <QRegularExpression>
#include <algorithm>
#include <stdarg.h>
#include <stdio.h>
#include <sys/stat.h>

extern "C" {
  #include <libdvbv5/dvb-fe.h>
}

#include "isdbtunermanager.h"

// krazy:excludeall=syscalls

static const char loglevel[9][10] = {
	{"EMERG"},
	{"ALERT"},
	{"CRITICAL"},
	{"ERROR"},
	{"WARNING"},
	{"NOTICE"},
	{"INFO"},
	{"DEBUG"},
	{"OTHER"},
};

#define loglevels ((int)(sizeof(loglevel)/sizeof(*loglevel)))

static void dvbv5_log(int level, const char *fmt, ...)
{
	va_list ap;
	char log[1024];

	if (level >= loglevels)
		level = loglevels - 1;

	va_start(ap, fmt);
	vsnprintf(log, sizeof(log), fmt, ap);
	va_end(ap);

	qCDebug(logDev, "libdvbv5 %s %s", loglevel[level], log);
}

static QStringList numberedPaths(const char *prefix, int count)
{
	QStringList paths;

	for (int i = 0; i < count; ++i) {
		paths.append(QString(QLatin1String("%1%2")).arg(QLatin1String(prefix)).arg(i));
	}

	return paths;
}

// numbers n with n % 4 in (first, first + 1)
static QStringList pt1Pt3Px4Paths(const char *prefix, int count, int first)
{
	QStringList paths;

	for (int i = 0; i < count; ++i) {
		int remainder = (i % 4);

		if ((remainder == first) || (remainder == first + 1)) {
			paths.append(QString(QLatin1String("%1%2")).arg(QLatin1String(prefix)).arg(i));
		}
	}

	return paths;
}

QStringList IsdbTunerManager::terrestrialOnlyDevicePaths()
{
	return pt1Pt3Px4Paths("/dev/px4video", 16, 2) + pt1Pt3Px4Paths("/dev/pt3video", 8, 2) +
		pt1Pt3Px4Paths("/dev/pt1video", 8, 2) + numberedPaths("/dev/pxs1urvideo", 8);
}

QStringList IsdbTunerManager::satelliteOnlyDevicePaths()
{
	return pt1Pt3Px4Paths("/dev/px4video", 16, 0) + pt1Pt3Px4Paths("/dev/pt3video", 8, 0) +
		pt1Pt3Px4Paths("/dev/pt1video", 8, 0);
}

QStringList IsdbTunerManager::multiDevicePaths()
{
	return numberedPaths("/dev/isdb6014video", 8) + numberedPaths("/dev/pxmlt5video", 10) +
		numberedPaths("/dev/pxmlt8video", 16) + numberedPaths("/dev/isdb2056video", 8) +
		numberedPaths("/dev/pxm1urvideo", 8);
}

IsdbTunerManager::IsdbTunerManager(IsdbProcessFactory *processFactory_) :
	processFactory(processFactory_)
{
}

IsdbTunerManager::~IsdbTunerManager()
{
	qDeleteAll(terrestrialOnlyTuners);
	qDeleteAll(satelliteOnlyTuners);
	qDeleteAll(multiTuners);
}

void IsdbTunerManager::scanDevices()
{
	addChardevTuners(terrestrialOnlyDevicePaths());
	addChardevTuners(satelliteOnlyDevicePaths());
	addChardevTuners(multiDevicePaths());
	addDvbTuners();
}

void IsdbTunerManager::addTuner(IsdbTuner *tuner)
{
	qCInfo(logDev, "Found tuner %s: %s [%s]", qPrintable(tuner->getDevicePath()),
		qPrintable(tuner->getName()), qPrintable(IsdbTuner::tunerTypeName(tuner->getType())));

	switch (tuner->getType()) {
	case IsdbTuner::IsdbT:
		terrestrialOnlyTuners.append(tuner);
		break;
	case IsdbTuner::IsdbS:
		satelliteOnlyTuners.append(tuner);
		break;
	case IsdbTuner::IsdbTS:
		multiTuners.append(tuner);
		break;
	}
}

bool IsdbTunerManager::isCharDevice(const QString &path)
{
	struct stat buffer;

	if (stat(QFile::encodeName(path).constData(), &buffer) != 0) {
		return false;
	}

	return S_ISCHR(buffer.st_mode);
}

int IsdbTunerManager::readSysAttr(const QString &path)
{
	QFile file(path);

	if (!file.open(QIODevice::ReadOnly)) {
		return -1;
	}

	QByteArray data = file.read(8);

	if ((data.size() == 0) || (data.size() == 8)) {
		return -1;
	}

	// pci attributes carry a 0x prefix, usb attributes don't
	data = data.simplified();

	if (data.startsWith("0x")) {
		data.remove(0, 2);
	}

	bool ok = false;
	int value = data.toInt(&ok, 16);

	if (!ok || (value < 0) || (value > 0xffff)) {
		return -1;
	}

	return value;
}

void IsdbTunerManager::pt1Pt3Px4TunerInfo(int deviceNumber, IsdbTuner::TunerType *type,
	int *tunerNumber)
{
	int remainder = (deviceNumber % 4);

	if (remainder <= 1) {
		*type = IsdbTuner::IsdbS;
		*tunerNumber = ((deviceNumber / 4) * 2) + 1;
	} else {
		*type = IsdbTuner::IsdbT;
		*tunerNumber = (((deviceNumber - 2) / 4) * 2) + 1;
	}

	if ((remainder == 1) || (remainder == 3)) {
		++(*tunerNumber);
	}
}

QString IsdbTunerManager::px4ModelNames()
{
	QMap<int, QString> models;
	models.insert(0x083f, QLatin1String("PX-W3U4"));
	models.insert(0x084a, QLatin1String("PX-Q3U4"));
	models.insert(0x023f, QLatin1String("PX-W3PE4"));
	models.insert(0x024a, QLatin1String("PX-Q3PE4"));
	models.insert(0x073f, QLatin1String("PX-W3PE5"));
	models.insert(0x074a, QLatin1String("PX-Q3PE5"));

	QDir dir(QLatin1String("/sys/bus/usb/devices"));
	QStringList names;

	foreach (const QString &entry, dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
		QString path = dir.filePath(entry) + QLatin1Char('/');

		// digibest
		if (readSysAttr(path + QLatin1String("idVendor")) != 0x0511) {
			continue;
		}

		QString model = models.value(readSysAttr(path + QLatin1String("idProduct")));

		if (!model.isEmpty() && !names.contains(model)) {
			names.append(model);
		}
	}

	if (names.isEmpty()) {
		return QLatin1String("PX4/PX5 Series");
	}

	names.sort();
	return names.join(QLatin1String(" / "));
}

bool IsdbTunerManager::chardevTunerInfo(const QString &devicePath, IsdbTuner::TunerType *type,
	QString *name)
{
	static const QRegularExpression pathRegExp(QLatin1String("^/dev/([a-z0-9]+?)video(\\d+)$"));
	QRegularExpressionMatch match = pathRegExp.match(devicePath);

	if (!match.hasMatch()) {
		return false;
	}

	QString driver = match.captured(1);
	int deviceNumber = match.captured(2).toInt();
	int tunerNumber;

	if ((driver == QLatin1String("pt1")) || (driver == QLatin1String("pt3")) ||
	    (driver == QLatin1String("px4"))) {
		pt1Pt3Px4TunerInfo(deviceNumber, type, &tunerNumber);
		QString model;

		if (driver == QLatin1String("pt1")) {
			model = QLatin1String("Earthsoft PT1 / PT2");
		} else if (driver == QLatin1String("pt3")) {
			model = QLatin1String("Earthsoft PT3");
		} else {
			model = QLatin1String("PLEX ") + px4ModelNames();
		}

		*name = QString(QLatin1String("%1 (%2) #%3")).arg(model, IsdbTuner::tunerTypeName(*type))
			.arg(tunerNumber);
		return true;
	}

	QString model;

	if (driver == QLatin1String("pxs1ur")) {
		*type = IsdbTuner::IsdbT;
		model = QLatin1String("PLEX PX-S1UR");
	} else if (driver == QLatin1String("pxm1ur")) {
		*type = IsdbTuner::IsdbTS;
		model = QLatin1String("PLEX PX-M1UR");
	} else if (driver == QLatin1String("pxmlt5")) {
		*type = IsdbTuner::IsdbTS;
		model = QLatin1String("PLEX PX-MLT5PE");
	} else if (driver == QLatin1String("pxmlt8")) {
		*type = IsdbTuner::IsdbTS;
		model = QLatin1String("PLEX PX-MLT8PE");
	} else if (driver == QLatin1String("isdb6014")) {
		*type = IsdbTuner::IsdbTS;
		model = QLatin1String("e-better DTV02A-4TS-P");
	} else if (driver == QLatin1String("isdb2056")) {
		*type = IsdbTuner::IsdbTS;
		model = QLatin1String("e-better DTV02A-1T1S-U");
	} else {
		return false;
	}

	*name = QString(QLatin1String("%1 #%2")).arg(model).arg(deviceNumber + 1);
	return true;
}

void IsdbTunerManager::addChardevTuners(const QStringList &devicePaths)
{
	foreach (const QString &devicePath, devicePaths) {
		if (!isCharDevice(devicePath)) {
			continue;
		}

		IsdbTuner::TunerType type;
		QString name;

		if (!chardevTunerInfo(devicePath, &type, &name)) {
			qCWarning(logDev, "Unsupported chardev tuner %s", qPrintable(devicePath));
			continue;
		}

		addTuner(new IsdbTuner(devicePath, IsdbTuner::ChardevDevice, type, name,
			processFactory));
	}
}

QString IsdbTunerManager::dvbTunerName(const QString &sysfsPath, IsdbTuner::TunerType type,
	const QString &defaultName)
{
	// the frontend names reported by the drivers are rarely accurate
	if (QFile::exists(sysfsPath + QLatin1String("device/idVendor"))) {
		// USB device
		int vendor = readSysAttr(sysfsPath + QLatin1String("device/idVendor"));
		int product = readSysAttr(sysfsPath + QLatin1String("device/idProduct"));

		if ((vendor == 0x187f) && (product == 0x0600)) {
			return QLatin1String("MyGica S270 / S880i");
		}

		if ((vendor == 0x3275) && (product == 0x0080)) {
			return QLatin1String("PLEX PX-S1UD / PX-Q1UD / VASTDTV VT20");
		}
	} else if (QFile::exists(sysfsPath + QLatin1String("device/vendor"))) {
		// PCI device
		int vendor = readSysAttr(sysfsPath + QLatin1String("device/vendor"));
		int pciDevice = readSysAttr(sysfsPath + QLatin1String("device/device"));
		int subsystemVendor = readSysAttr(sysfsPath + QLatin1String("device/subsystem_vendor"));
		int subsystemDevice = readSysAttr(sysfsPath + QLatin1String("device/subsystem_device"));
		QString model;

		if ((vendor == 0x10ee) && (pciDevice == 0x211a)) {
			model = QLatin1String("Earthsoft PT1");
		} else if ((vendor == 0x10ee) && (pciDevice == 0x222a)) {
			model = QLatin1String("Earthsoft PT2");
		} else if ((vendor == 0x1172) && (pciDevice == 0x4c15) &&
			   (subsystemVendor == 0xee8d) && (subsystemDevice == 0x0368)) {
			model = QLatin1String("Earthsoft PT3");
		} else if (vendor == 0xdd01) {
			// digital devices
			if ((pciDevice == 0x000a) && (subsystemDevice == 0x0050)) {
				return QLatin1String("Digital Devices DD Max M4");
			} else if ((pciDevice == 0x0022) && (subsystemDevice == 0x0052)) {
				return QLatin1String("Digital Devices DD Max M8");
			} else if ((pciDevice == 0x0024) && (subsystemDevice == 0x0053)) {
				return QLatin1String("Digital Devices DD Max M8A");
			} else if ((pciDevice == 0x0008) && (subsystemDevice == 0x0036)) {
				return QLatin1String("Digital Devices DD Max A8i");
			}
		}

		if (!model.isEmpty() && (type != IsdbTuner::IsdbTS)) {
			return QString(QLatin1String("%1 (%2)")).arg(model, IsdbTuner::tunerTypeName(type));
		}
	}

	return defaultName;
}

void IsdbTunerManager::numberTunerNames(QStringList *names)
{
	QMap<QString, int> counts;

	for (int i = 0; i < names->size(); ++i) {
		int count = ++counts[names->at(i)];
		(*names)[i] += QString(QLatin1String(" #%1")).arg(count);
	}
}

void IsdbTunerManager::addDvbTuners()
{
	QDir dir(QLatin1String("/dev/dvb"));
	QList<int> adapters;

	foreach (const QString &entry, dir.entryList(QStringList(QLatin1String("adapter*")),
		 QDir::Dirs | QDir::System)) {
		bool ok;
		int adapter = entry.mid(7).toInt(&ok);

		if (ok) {
			adapters.append(adapter);
		}
	}

	std::sort(adapters.begin(), adapters.end());

	QStringList devicePaths;
	QList<IsdbTuner::TunerType> types;
	QStringList names;

	foreach (int adapter, adapters) {
		QString devicePath = QString(QLatin1String("/dev/dvb/adapter%1/frontend0")).arg(adapter);

		if (!isCharDevice(devicePath)) {
			continue;
		}

		struct dvb_v5_fe_parms *parms = dvb_fe_open2(adapter, 0, 0, 0, dvbv5_log);

		if (!parms) {
			qCWarning(logDev, "Cannot open frontend %s", qPrintable(devicePath));
			continue;
		}

		bool isdbT = false;
		bool isdbS = false;

		for (int i = 0; i < parms->num_systems; i++) {
			switch (parms->systems[i]) {
			case SYS_ISDBT:
				isdbT = true;
				break;
			case SYS_ISDBS:
				isdbS = true;
				break;
			default:
				break;
			}
		}

		QString frontendName = QString::fromUtf8(parms->info.name);
		dvb_fe_close(parms);

		if (!isdbT && !isdbS) {
			qCDebug(logDev, "Frontend %s (%s) supports neither ISDB-T nor ISDB-S",
				qPrintable(devicePath), qPrintable(frontendName));
			continue;
		}

		IsdbTuner::TunerType type = IsdbTuner::IsdbTS;

		if (!isdbS) {
			type = IsdbTuner::IsdbT;
		} else if (!isdbT) {
			type = IsdbTuner::IsdbS;
		}

		QString sysfsPath = QString(QLatin1String("/sys/class/dvb/dvb%1.frontend0/")).arg(adapter);
		devicePaths.append(devicePath);
		types.append(type);
		names.append(dvbTunerName(sysfsPath, type, frontendName));
	}

	numberTunerNames(&names);

	for (int i = 0; i < devicePaths.size(); ++i) {
		addTuner(new IsdbTuner(devicePaths.at(i), IsdbTuner::V4lDvbDevice, types.at(i),
			names.at(i), processFactory));
	}
}
