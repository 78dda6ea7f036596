/**
 * @file lookup_tables_builtin.cpp
 * @brief Built-in lookup table snapshot
 *
 * Company identifiers come from the Bluetooth SIG assigned numbers. MAC
 * prefixes cover vendors frequently met in home environments.
 */

#include "btcatalog/lookup_tables.h"
#include <utility>

namespace btcatalog {

namespace {

constexpr const char *BUILTIN_VERSION = "builtin-2024.1";

const std::pair<uint16_t, const char *> BUILTIN_MANUFACTURERS[] = {
    {0x004C, "Apple, Inc."},
    {0x0006, "Microsoft"},
    {0x000F, "Broadcom Corporation"},
    {0x0075, "Samsung Electronics Co. Ltd."},
    {0x0001, "Ericsson Technology Licensing"},
    {0x00E0, "Google Inc."},
    {0x008A, "Bose Corporation"},
    {0x000A, "Nokia"},
    {0x00D2, "Seiko Epson Corporation"},
    {0x004D, "Motorola Mobility LLC"},
    {0x0002, "Intel Corp."},
    {0x00E8, "Fitbit, Inc."},
    {0x00D7, "Continental Automotive Systems"},
    {0x00D6, "Hewlett-Packard Company"},
    {0x0197, "Huawei Technologies Co., Ltd."},
    {0x038F, "XIAOMI Inc."},
    {0x0499, "Ruuvi Innovations Ltd."},
    {0x0157, "Anhui Huami Information Technology Co., Ltd."},
    {0x0030, "ST Microelectronics"},
    {0x0059, "Nordic Semiconductor ASA"},
    {0x0131, "Cypress Semiconductor"},
    {0x02D5, "Spotify AB"},
    {0x0047, "Plantronics, Inc."},
    {0x0078, "Sony Corporation"},
    {0x0301, "Sony Mobile Communications Inc."},
    {0x0080, "Toshiba Corporation"},
    {0x0046, "Bang & Olufsen A/S"},
    {0x01D7, "Jabra"},
    {0x00C6, "Beats Electronics, LLC"},
    {0x0310, "Realtek Semiconductor Corp."},
    {0x004E, "Razer Inc."},
    {0x0177, "Jaybird LLC"},
    {0x0126, "SOL REPUBLIC"},
    {0x0362, "HARMAN International Industries, Inc."},
    {0x0111, "Logitech International SA"},
    {0x00F0, "JVCKENWOOD Corporation"},
    {0x0186, "Signify Netherlands B.V. (formerly Philips Lighting B.V.)"},
    {0x0057, "Garmin International, Inc."},
    {0x029F, "Tile, Inc."},
    {0x0107, "Belkin International, Inc."},
    {0x000B, "Sonos Inc."},
    {0x01D9, "Flic"},
    {0x05D7, "LEDVANCE GmbH"},
    {0x0276, "IKEA of Sweden AB"},
    {0x026A, "Ilumi Solutions Inc."},
    {0x025A, "Roku, Inc."},
    {0x0154, "Nintendo Co., Ltd."},
    {0x0012, "Sony Interactive Entertainment Inc."},
    {0x01A4, "Valve Corporation"},
    {0x0036, "TomTom International BV"},
    {0x00E9, "Visteon Corporation"},
    {0x01E5, "Parrot SA"},
    {0x019A, "Arcadyan Corporation"},
    {0x012A, "INGENICO"},
    {0x0060, "SiRF Technology, Inc."},
    {0x3213, "FREEBOX SAS"},
    {0x07CB, "FREEBOX SA"},
    {0x24D4, "FREEBOX SAS"},
    {0x01FF, "Facebook, Inc."},
    {0x00F2, "Ubiquitous Computing Technology Corporation"},
    {0x0560, "Withings"},
    {0x013E, "Nod, Inc."},
    {0x0052, "Tesla, Inc."},
    {0x021A, "Bookie Corporation"},
    {0x034C, "GoPro, Inc."},
    {0x02C4, "Procter & Gamble"},
    {0x0188, "Clover Network, Inc."},
    {0x0500, "Wiliot LTD."},
    {0x02CA, "Dyson Technology Limited"},
    {0x0201, "Polar Electro Oy"},
    {0x0352, "Snapchat Inc"},
    {0x0387, "ESET, spol. s r.o."},
    {0x0225, "Nestlé Nespresso S.A."},
    {0x03DA, "CRESCO Wireless, Inc"},
    {0x02A9, "Sonova AG"},
    {0x0626, "Audio-Technica Corporation"},
    {0x0520, "OPPO Electronics Co., Ltd."},
    {0x06D6, "Instacart"},
    {0x0529, "Honor Device Co., Ltd."},
    {0x0602, "OnePlus Technology (Shenzhen) Co., Ltd"},
    {0x0614, "DJI Innovations"},
    {0x0717, "Canon Inc."},
    {0x0822, "Skullcandy Inc."},
    {0x0831, "Sennheiser electronic GmbH & Co. KG"},
};

struct PrefixRow {
  const char *prefix;
  VendorHint hint;
};

const PrefixRow BUILTIN_PREFIXES[] = {
    {"14:0C:76", {"Freebox SA", "Freebox", "Freebox Player", "Freebox Player"}},
    {"E4:F0:42", {"Freebox SA", "Freebox", "Freebox Revolution", "Freebox Revolution"}},
    {"DC:F5:05", {"Freebox SA", "Freebox", "Freebox Delta", "Freebox Delta"}},
    {"38:17:E3", {"Freebox SA", "Freebox", "Freebox Mini 4K", "Freebox Mini 4K"}},
    {"54:B8:0A", {"Freebox SA", "Freebox", "Freebox Pop", "Freebox Pop"}},
    {"00:07:CB", {"FREEBOX SA", "Freebox", "Freebox", "Freebox"}},
    {"00:24:D4", {"FREEBOX SAS", "Freebox", "Freebox", "Freebox"}},
    {"70:FC:8F", {"Freebox SA", "Freebox", "Freebox Server", "Freebox Server"}},
    {"14:A7:2B", {"Freebox SA", "Freebox", "Freebox Server Mini", "Freebox Server Mini"}},
    {"F4:CA:E5", {"Freebox SA", "Freebox", "Freebox Player Mini", "Freebox Player Mini"}},
    {"00:03:93", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:0A:27", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:0A:95", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:0D:93", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:10:FA", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:11:24", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:14:51", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:16:CB", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:17:F2", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:19:E3", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1C:B3", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1D:4F", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1E:52", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1E:C2", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1F:5B", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:1F:F3", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:21:E9", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:22:41", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:23:12", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:23:32", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:23:6C", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:23:DF", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:24:36", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:25:00", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:25:4B", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:25:BC", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:26:08", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:26:4A", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:26:B0", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:26:BB", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:30:65", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"00:3E:E1", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:0C:CE", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:15:52", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:1E:64", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:26:65", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:48:9A", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:4B:ED", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:52:F7", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:54:53", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:69:F8", {"Apple, Inc.", "Mobile", "iPhone", "iPhone"}},
    {"04:D3:CF", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:E5:36", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:F1:3E", {"Apple, Inc.", "Computer", "Mac", "Mac"}},
    {"04:F7:E4", {"Apple, Inc.", "Audio", "AirPods", "AirPods"}},
    {"00:1A:8A", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"00:21:19", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"00:23:39", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"00:25:67", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"00:E0:64", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"08:08:C2", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"14:49:E0", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"14:7D:DA", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"14:89:FD", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"14:9F:3C", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"14:A3:64", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"1C:3A:DE", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"1C:62:B8", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"1C:66:AA", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"1C:AF:05", {"Samsung Electronics Co.,Ltd", "Mobile", "Galaxy", "Samsung Galaxy"}},
    {"00:1A:11", {"Google, Inc.", "Smart Home", "Home", "Google Home"}},
    {"08:9E:08", {"Google, Inc.", "Smart Home", "Chromecast", "Google Chromecast"}},
    {"20:DF:B9", {"Google, Inc.", "Smart Home", "Home", "Google Home"}},
    {"3C:5A:B4", {"Google, Inc.", "Smart Home", "Chromecast", "Google Chromecast"}},
    {"54:60:09", {"Google, Inc.", "Mobile", "Pixel", "Google Pixel"}},
    {"94:95:A0", {"Google, Inc.", "Mobile", "Pixel", "Google Pixel"}},
    {"F4:F5:D8", {"Google, Inc.", "Smart Home", "Chromecast", "Google Chromecast"}},
    {"F4:F5:E8", {"Google, Inc.", "Smart Home", "Chromecast", "Google Chromecast"}},
    {"F8:8F:CA", {"Google, Inc.", "Smart Home", "Chromecast", "Google Chromecast"}},
    {"00:01:4A", {"Sony Corporation", "Audio", "Unknown", "Sony Device"}},
    {"00:24:BE", {"Sony Corporation", "Audio", "Unknown", "Sony Device"}},
    {"30:F9:ED", {"Sony Corporation", "Audio", "WH-1000XM", "Sony Headphones"}},
    {"40:2B:A1", {"Sony Corporation", "Audio", "WH-1000XM", "Sony Headphones"}},
    {"58:48:22", {"Sony Corporation", "Audio", "WH-1000XM", "Sony Headphones"}},
    {"D8:D4:3C", {"Sony Corporation", "Audio", "WH-1000XM", "Sony Headphones"}},
    {"00:15:5D", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"28:18:78", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"3C:A3:15", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"58:82:A8", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"60:45:BD", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"7C:1E:52", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"7C:ED:8D", {"Microsoft Corporation", "Computer", "Surface", "Microsoft Surface"}},
    {"00:EC:0A", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"0C:1D:AF", {"Xiaomi Communications Co Ltd", "Mobile", "Redmi", "Xiaomi Redmi"}},
    {"10:2A:B3", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"14:F6:5A", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"18:59:36", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"20:A7:83", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"28:6C:07", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"28:E3:1F", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"3C:BD:D8", {"Xiaomi Communications Co Ltd", "Mobile", "Mi", "Xiaomi Mi"}},
    {"40:31:3C", {"Xiaomi Communications Co Ltd", "Mobile", "Redmi", "Xiaomi Redmi"}},
    {"00:02:EE", {"Nokia Denmark A/S", "Audio", "Bluetooth Audio", "Nokia Audio"}},
    {"00:09:A7", {"Bang & Olufsen A/S", "Audio", "Beoplay", "B&O Beoplay"}},
    {"00:0D:3C", {"i.Tech Dynamic Ltd", "Audio", "Bluetooth Audio", "i.Tech Audio"}},
    {"00:0E:9F", {"Temic SDS GmbH", "Audio", "Car Audio", "Vehicle Audio System"}},
    {"00:11:67", {"Integrated System Solution Corp.", "Audio", "Bluetooth Audio", "ISSC Audio"}},
    {"00:12:A1", {"BlueRadios, Inc.", "Audio", "Bluetooth Audio", "BlueRadios Audio"}},
    {"00:13:17", {"GN Netcom A/S", "Audio", "Jabra", "Jabra Headset"}},
    {"00:14:A4", {"Motorola Mobility, Inc.", "Audio", "Headset", "Motorola Headset"}},
    {"00:16:94", {"Sennheiser Communications A/S", "Audio", "Headset", "Sennheiser Headset"}},
    {"00:17:00", {"Kobe Steel, Ltd.", "Audio", "Bluetooth Audio", "Bluetooth Audio"}},
    {"00:18:09", {"CRESYN", "Audio", "Bluetooth Audio", "CRESYN Audio"}},
    {"00:18:91", {"Zhongshan General K-mate Electronics Co., Ltd", "Audio", "Bluetooth Audio", "K-mate Audio"}},
    {"00:19:1D", {"Nintendo Co.,Ltd.", "Gaming", "Nintendo Switch", "Nintendo Switch"}},
};

} // namespace

LookupTables LookupTables::builtin() {
  LookupTables tables;
  tables.set_version(BUILTIN_VERSION);

  for (const auto &[id, name] : BUILTIN_MANUFACTURERS) {
    tables.add_manufacturer(id, name);
  }
  for (const auto &row : BUILTIN_PREFIXES) {
    tables.add_prefix(row.prefix, row.hint);
  }

  return tables;
}

} // namespace btcatalog
