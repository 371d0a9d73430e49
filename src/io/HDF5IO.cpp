// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <knet_reader/io/HDF5IO.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

namespace knet_reader {

bool HDF5IO::write(const std::string& filename, const TimeSeriesRecord& record) {
    auto t0 = std::chrono::high_resolution_clock::now();

    std::filesystem::path filepath(filename);
    if (!filepath.parent_path().empty() && !std::filesystem::exists(filepath.parent_path())) {
        last_error_ = "Directory does not exist: " + filepath.parent_path().string();
        return false;
    }

    if (record.sample_count != record.samples.size()) {
        std::ostringstream oss;
        oss << "sample_count (" << record.sample_count
            << ") does not match number of samples (" << record.samples.size() << ")";
        last_error_ = oss.str();
        return false;
    }

    hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to create HDF5 file: " + filename;
        return false;
    }

    bool success = true;
    success = success && writeMetadata(file_id, record);
    success = success && writeEvent(file_id, record.header);
    success = success && writeStation(file_id, record.header);
    success = success && writeRecording(file_id, record.header);
    success = success && writeWaveform(file_id, record);

    H5Fclose(file_id);

    if (!success) {
        std::filesystem::remove(filename);
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][HDF5IO] write file='" << filename << "' time=" << ms << " ms" << std::endl;
    return success;
}

bool HDF5IO::read(const std::string& filename, TimeSeriesRecord& record) {
    auto t0 = std::chrono::high_resolution_clock::now();

    if (!std::filesystem::exists(filename)) {
        last_error_ = "File does not exist: " + filename;
        return false;
    }

    hid_t file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to open HDF5 file: " + filename;
        return false;
    }

    record = TimeSeriesRecord{};
    bool success = true;
    success = success && readMetadata(file_id, record);
    success = success && readEvent(file_id, record.header);
    success = success && readStation(file_id, record.header);
    success = success && readRecording(file_id, record.header);
    success = success && readWaveform(file_id, record);

    H5Fclose(file_id);

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][HDF5IO] read file='" << filename << "' time=" << ms << " ms" << std::endl;
    return success;
}

bool HDF5IO::isValidHDF5(const std::string& filename) const {
    if (!std::filesystem::exists(filename)) {
        return false;
    }

    htri_t is_hdf5 = H5Fis_hdf5(filename.c_str());
    return is_hdf5 > 0;
}

bool HDF5IO::createGroup(hid_t file_id, const std::string& group_name) {
    hid_t group_id = H5Gcreate2(file_id, group_name.c_str(),
                                H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to create group: " + group_name;
        return false;
    }
    H5Gclose(group_id);
    return true;
}

bool HDF5IO::writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value) {
    hid_t datatype = H5Tcopy(H5T_C_S1);
    H5Tset_size(datatype, value.size() + 1);
    H5Tset_strpad(datatype, H5T_STR_NULLTERM);

    hid_t dataspace = H5Screate(H5S_SCALAR);
    hid_t attribute = H5Acreate2(loc_id, name.c_str(), datatype, dataspace,
                                 H5P_DEFAULT, H5P_DEFAULT);

    if (attribute < 0) {
        H5Sclose(dataspace);
        H5Tclose(datatype);
        last_error_ = "Failed to create attribute: " + name;
        return false;
    }

    herr_t status = H5Awrite(attribute, datatype, value.c_str());

    H5Aclose(attribute);
    H5Sclose(dataspace);
    H5Tclose(datatype);

    if (status < 0) {
        last_error_ = "Failed to write attribute: " + name;
        return false;
    }
    return true;
}

bool HDF5IO::readStringAttribute(hid_t loc_id, const std::string& name, std::string& value) {
    if (H5Aexists(loc_id, name.c_str()) <= 0) {
        return false;
    }

    hid_t attribute = H5Aopen(loc_id, name.c_str(), H5P_DEFAULT);
    if (attribute < 0) {
        return false;
    }

    hid_t datatype = H5Aget_type(attribute);
    size_t size = H5Tget_size(datatype);

    value.resize(size);
    herr_t status = H5Aread(attribute, datatype, &value[0]);

    size_t null_pos = value.find('\0');
    if (null_pos != std::string::npos) {
        value.resize(null_pos);
    }

    H5Tclose(datatype);
    H5Aclose(attribute);

    return status >= 0;
}

bool HDF5IO::writeScalar(hid_t group_id, const std::string& name, hid_t type, const void* value) {
    hsize_t dims = 1;
    hid_t dataspace = H5Screate_simple(1, &dims, NULL);
    hid_t dataset = H5Dcreate2(group_id, name.c_str(), type, dataspace,
                               H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dataset < 0) {
        H5Sclose(dataspace);
        last_error_ = "Failed to create dataset: " + name;
        return false;
    }
    herr_t status = H5Dwrite(dataset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, value);
    H5Dclose(dataset);
    H5Sclose(dataspace);
    if (status < 0) {
        last_error_ = "Failed to write dataset: " + name;
        return false;
    }
    return true;
}

bool HDF5IO::readScalar(hid_t group_id, const std::string& name, hid_t type, void* value) {
    if (H5Lexists(group_id, name.c_str(), H5P_DEFAULT) <= 0) {
        last_error_ = "Dataset not found: " + name;
        return false;
    }
    hid_t dataset = H5Dopen2(group_id, name.c_str(), H5P_DEFAULT);
    if (dataset < 0) {
        last_error_ = "Failed to open dataset: " + name;
        return false;
    }
    herr_t status = H5Dread(dataset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, value);
    H5Dclose(dataset);
    return status >= 0;
}

bool HDF5IO::writeMetadata(hid_t file_id, const TimeSeriesRecord& record) {
    if (!createGroup(file_id, "/metadata")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/metadata", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    const HeaderRecord& header = record.header;
    bool success = true;
    success = success && writeStringAttribute(group_id, "version", kFormatVersion);
    success = success && writeStringAttribute(group_id, "source_format", "K-NET ASCII");
    success = success && writeStringAttribute(group_id, "network", header.network_code);
    success = success && writeStringAttribute(group_id, "station", header.station_code);
    success = success && writeStringAttribute(group_id, "location", header.location_code);
    success = success && writeStringAttribute(group_id, "channel", header.channel_code);
    success = success && writeStringAttribute(group_id, "event_origin_time",
                                              formatIso8601(header.event_origin_time));
    success = success && writeStringAttribute(group_id, "record_start_time",
                                              formatIso8601(header.record_start_time));
    success = success && writeStringAttribute(group_id, "last_correction_time",
                                              formatIso8601(header.last_correction_time));
    if (header.comment) {
        success = success && writeStringAttribute(group_id, "comment", *header.comment);
    }

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::readMetadata(hid_t file_id, TimeSeriesRecord& record) {
    if (!H5Lexists(file_id, "/metadata", H5P_DEFAULT)) {
        last_error_ = "Metadata group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/metadata", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    HeaderRecord& header = record.header;
    readStringAttribute(group_id, "network", header.network_code);
    readStringAttribute(group_id, "station", header.station_code);
    readStringAttribute(group_id, "location", header.location_code);
    readStringAttribute(group_id, "channel", header.channel_code);

    std::string comment;
    if (readStringAttribute(group_id, "comment", comment)) {
        header.comment = comment;
    }

    H5Gclose(group_id);
    return true;
}

bool HDF5IO::writeEvent(hid_t file_id, const HeaderRecord& header) {
    if (!createGroup(file_id, "/event")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/event", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    const int64_t origin_ms = toEpochMilliseconds(header.event_origin_time);
    bool success = true;
    success = success && writeScalar(group_id, "origin_time_ms", H5T_NATIVE_INT64, &origin_ms);
    success = success && writeScalar(group_id, "latitude", H5T_NATIVE_DOUBLE, &header.event_latitude);
    success = success && writeScalar(group_id, "longitude", H5T_NATIVE_DOUBLE, &header.event_longitude);
    success = success && writeScalar(group_id, "depth_km", H5T_NATIVE_DOUBLE, &header.event_depth_km);
    success = success && writeScalar(group_id, "magnitude", H5T_NATIVE_DOUBLE, &header.event_magnitude);

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::readEvent(hid_t file_id, HeaderRecord& header) {
    if (!H5Lexists(file_id, "/event", H5P_DEFAULT)) {
        last_error_ = "Event group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/event", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    int64_t origin_ms = 0;
    bool success = true;
    success = success && readScalar(group_id, "origin_time_ms", H5T_NATIVE_INT64, &origin_ms);
    success = success && readScalar(group_id, "latitude", H5T_NATIVE_DOUBLE, &header.event_latitude);
    success = success && readScalar(group_id, "longitude", H5T_NATIVE_DOUBLE, &header.event_longitude);
    success = success && readScalar(group_id, "depth_km", H5T_NATIVE_DOUBLE, &header.event_depth_km);
    success = success && readScalar(group_id, "magnitude", H5T_NATIVE_DOUBLE, &header.event_magnitude);
    header.event_origin_time = fromEpochMilliseconds(origin_ms);

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::writeStation(hid_t file_id, const HeaderRecord& header) {
    if (!createGroup(file_id, "/station")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/station", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    bool success = true;
    success = success && writeScalar(group_id, "latitude", H5T_NATIVE_DOUBLE, &header.station_latitude);
    success = success && writeScalar(group_id, "longitude", H5T_NATIVE_DOUBLE, &header.station_longitude);
    success = success && writeScalar(group_id, "elevation_m", H5T_NATIVE_DOUBLE, &header.station_elevation_m);

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::readStation(hid_t file_id, HeaderRecord& header) {
    if (!H5Lexists(file_id, "/station", H5P_DEFAULT)) {
        last_error_ = "Station group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/station", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    bool success = true;
    success = success && readScalar(group_id, "latitude", H5T_NATIVE_DOUBLE, &header.station_latitude);
    success = success && readScalar(group_id, "longitude", H5T_NATIVE_DOUBLE, &header.station_longitude);
    success = success && readScalar(group_id, "elevation_m", H5T_NATIVE_DOUBLE, &header.station_elevation_m);

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::writeRecording(hid_t file_id, const HeaderRecord& header) {
    if (!createGroup(file_id, "/recording")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/recording", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    const int64_t start_ms = toEpochMilliseconds(header.record_start_time);
    const int64_t correction_ms = toEpochMilliseconds(header.last_correction_time);
    const int32_t rate = header.sampling_rate_hz;

    bool success = true;
    success = success && writeScalar(group_id, "start_time_ms", H5T_NATIVE_INT64, &start_ms);
    success = success && writeScalar(group_id, "sampling_rate_hz", H5T_NATIVE_INT32, &rate);
    success = success && writeScalar(group_id, "duration_s", H5T_NATIVE_DOUBLE, &header.duration_s);
    success = success && writeScalar(group_id, "calibration_factor", H5T_NATIVE_DOUBLE,
                                     &header.calibration_factor);
    success = success && writeScalar(group_id, "max_acceleration_gal", H5T_NATIVE_DOUBLE,
                                     &header.max_acceleration_gal);
    success = success && writeScalar(group_id, "last_correction_time_ms", H5T_NATIVE_INT64, &correction_ms);

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::readRecording(hid_t file_id, HeaderRecord& header) {
    if (!H5Lexists(file_id, "/recording", H5P_DEFAULT)) {
        last_error_ = "Recording group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/recording", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    int64_t start_ms = 0;
    int64_t correction_ms = 0;
    int32_t rate = 0;

    bool success = true;
    success = success && readScalar(group_id, "start_time_ms", H5T_NATIVE_INT64, &start_ms);
    success = success && readScalar(group_id, "sampling_rate_hz", H5T_NATIVE_INT32, &rate);
    success = success && readScalar(group_id, "duration_s", H5T_NATIVE_DOUBLE, &header.duration_s);
    success = success && readScalar(group_id, "calibration_factor", H5T_NATIVE_DOUBLE,
                                    &header.calibration_factor);
    success = success && readScalar(group_id, "max_acceleration_gal", H5T_NATIVE_DOUBLE,
                                    &header.max_acceleration_gal);
    success = success && readScalar(group_id, "last_correction_time_ms", H5T_NATIVE_INT64, &correction_ms);

    header.record_start_time = fromEpochMilliseconds(start_ms);
    header.last_correction_time = fromEpochMilliseconds(correction_ms);
    header.sampling_rate_hz = rate;

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::writeWaveform(hid_t file_id, const TimeSeriesRecord& record) {
    if (!createGroup(file_id, "/waveform")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/waveform", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    const uint64_t count = record.sample_count;
    bool success = writeScalar(group_id, "sample_count", H5T_NATIVE_UINT64, &count);

    if (success) {
        hsize_t dims = record.samples.size();
        hid_t dataspace = H5Screate_simple(1, &dims, NULL);
        hid_t dataset = H5Dcreate2(group_id, "samples", H5T_NATIVE_DOUBLE, dataspace,
                                   H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if (dataset >= 0) {
            if (!record.samples.empty()) {
                success = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                                   record.samples.data()) >= 0;
                if (!success) {
                    last_error_ = "Failed to write dataset: /waveform/samples";
                }
            }
            H5Dclose(dataset);
        } else {
            success = false;
            last_error_ = "Failed to create dataset: /waveform/samples";
        }
        H5Sclose(dataspace);
    }

    H5Gclose(group_id);
    return success;
}

bool HDF5IO::readWaveform(hid_t file_id, TimeSeriesRecord& record) {
    if (!H5Lexists(file_id, "/waveform", H5P_DEFAULT)) {
        last_error_ = "Waveform group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/waveform", H5P_DEFAULT);
    if (group_id < 0) {
        return false;
    }

    uint64_t count = 0;
    bool success = readScalar(group_id, "sample_count", H5T_NATIVE_UINT64, &count);

    if (success && H5Lexists(group_id, "samples", H5P_DEFAULT) > 0) {
        hid_t dataset = H5Dopen2(group_id, "samples", H5P_DEFAULT);
        hid_t space = H5Dget_space(dataset);
        hssize_t n = H5Sget_simple_extent_npoints(space);
        H5Sclose(space);

        if (n < 0 || static_cast<uint64_t>(n) != count) {
            last_error_ = "samples length does not match sample_count";
            success = false;
        } else {
            record.samples.resize(static_cast<size_t>(n));
            if (n > 0) {
                success = H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                                  record.samples.data()) >= 0;
            }
            record.sample_count = record.samples.size();
        }
        H5Dclose(dataset);
    } else if (success) {
        last_error_ = "Dataset not found: samples";
        success = false;
    }

    H5Gclose(group_id);
    return success;
}

}  // namespace knet_reader
