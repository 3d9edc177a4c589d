#include <astroio.hpp>
#include "mapping.hpp"
#include <sstream>
#include <stdexcept>
#ifdef __GPU__
#include "mapping_gpu.hpp"
#endif



static void check_map_size(const MemoryBuffer<int>& map_inds, const MemoryBuffer<bool>& conj, const char* caller){
    if(map_inds.size() != static_cast<size_t>(MAP_SIZE) || conj.size() != static_cast<size_t>(MAP_SIZE)){
        std::stringstream ss;
        ss << caller << ": 'map_inds' and 'conj' must have " << MAP_SIZE << " elements.";
        throw std::invalid_argument(ss.str());
    }
}



size_t get_n_visibility_blocks(const Visibilities& vis, const char* caller){
    if(vis.obsInfo.nAntennas != static_cast<unsigned int>(N_ANTENNAS)){
        std::stringstream ss;
        ss << caller << ": only " << N_ANTENNAS << "-antenna legacy correlator data is supported, got "
            << vis.obsInfo.nAntennas << " antennas.";
        throw std::invalid_argument(ss.str());
    }
    const size_t n_blocks {static_cast<size_t>(vis.integration_intervals()) * vis.nFrequencies};
    if(vis.size() != n_blocks * MAP_SIZE){
        std::stringstream ss;
        ss << caller << ": 'vis' holds " << vis.size() << " values, expected " << n_blocks * MAP_SIZE << ".";
        throw std::invalid_argument(ss.str());
    }
    return n_blocks;
}



static void check_map_offsets(const MemoryBuffer<int>& map_inds, const char* caller){
    const int *map_data {map_inds.data()};
    for(int k {0}; k < MAP_SIZE; k++){
        if(map_data[k] < 0 || map_data[k] >= MAP_SIZE){
            std::stringstream ss;
            ss << caller << ": map_inds[" << k << "] = " << map_data[k] << " is outside [0, "
                << MAP_SIZE << ").";
            throw std::out_of_range(ss.str());
        }
    }
}



static void check_baselines(const std::vector<int>& bad_baselines, const char* caller){
    for(int baseline : bad_baselines){
        if(baseline < 0 || baseline >= N_BASELINES){
            std::stringstream ss;
            ss << caller << ": baseline " << baseline << " is outside [0, " << N_BASELINES << ").";
            throw std::out_of_range(ss.str());
        }
    }
}



Visibilities reorder_visibilities(const Visibilities& vis, BaselineMap& map){
    get_n_visibility_blocks(vis, "reorder_visibilities");
    #ifdef __GPU__
    if(gpu_support() && num_available_gpus() > 0 && vis.on_gpu()){
        map.map_inds.to_gpu();
        map.conj.to_gpu();
        return reorder_visibilities_gpu(vis, map);
    }else{
        map.map_inds.to_cpu();
        map.conj.to_cpu();
        return reorder_visibilities_cpu(vis, map);
    }
    #else
    return reorder_visibilities_cpu(vis, map);
    #endif
}



Visibilities reorder_visibilities_cpu(const Visibilities& vis, const BaselineMap& map){
    const size_t n_blocks {get_n_visibility_blocks(vis, "reorder_visibilities_cpu")};
    Visibilities final_vis {vis};
    reorder_visibilities_cpu(vis.data(), final_vis.data(), n_blocks, map.map_inds, map.conj);
    return final_vis;
}



void reorder_visibilities_cpu(const std::complex<float>* raw, std::complex<float>* out, size_t n_blocks,
        const MemoryBuffer<int>& map_inds, const MemoryBuffer<bool>& conj){
    check_map_size(map_inds, conj, "reorder_visibilities_cpu");
    check_map_offsets(map_inds, "reorder_visibilities_cpu");
    const int *map_data {map_inds.data()};
    const bool *conj_data {conj.data()};

    #pragma omp parallel for schedule(static)
    for(long long block = 0; block < static_cast<long long>(n_blocks); block++){
        const std::complex<float>* curr_vis {raw + block * MAP_SIZE};
        std::complex<float>* new_vis {out + block * MAP_SIZE};
        for(int k {0}; k < MAP_SIZE; k++){
            const std::complex<float> value {curr_vis[map_data[k]]};
            new_vis[k] = conj_data[k] ? std::conj(value) : value;
        }
    }
}



// bad_baselines must already be validated
static void zero_baselines(std::complex<float>* data, size_t n_blocks, const std::vector<int>& bad_baselines){
    #pragma omp parallel for schedule(static)
    for(long long block = 0; block < static_cast<long long>(n_blocks); block++){
        std::complex<float>* block_data {data + block * MAP_SIZE};
        for(int baseline : bad_baselines){
            for(int pol {0}; pol < N_POL_PRODUCTS; pol++){
                block_data[baseline * N_POL_PRODUCTS + pol] = {0.0f, 0.0f};
            }
        }
    }
}



void reorder_flags_cpu(const bool* raw_flags, bool* out, size_t n_blocks, const MemoryBuffer<int>& map_inds){
    if(map_inds.size() != static_cast<size_t>(MAP_SIZE)){
        std::stringstream ss;
        ss << "reorder_flags_cpu: 'map_inds' must have " << MAP_SIZE << " elements.";
        throw std::invalid_argument(ss.str());
    }
    check_map_offsets(map_inds, "reorder_flags_cpu");
    const int *map_data {map_inds.data()};

    #pragma omp parallel for schedule(static)
    for(long long block = 0; block < static_cast<long long>(n_blocks); block++){
        const bool* curr_flags {raw_flags + block * MAP_SIZE};
        bool* new_flags {out + block * MAP_SIZE};
        for(int k {0}; k < MAP_SIZE; k++){
            new_flags[k] = curr_flags[map_data[k]];
        }
    }
}



void flag_baselines(Visibilities& vis, const std::vector<int>& bad_baselines){
    const size_t n_blocks {get_n_visibility_blocks(vis, "flag_baselines")};
    check_baselines(bad_baselines, "flag_baselines");
    #ifdef __GPU__
    if(gpu_support() && num_available_gpus() > 0 && vis.on_gpu()){
        return flag_baselines_gpu(vis, bad_baselines);
    }
    #endif
    zero_baselines(vis.data(), n_blocks, bad_baselines);
}



void flag_baselines_cpu(std::complex<float>* data, size_t n_blocks, const std::vector<int>& bad_baselines){
    check_baselines(bad_baselines, "flag_baselines_cpu");
    zero_baselines(data, n_blocks, bad_baselines);
}
