#include <iostream>
#include <stdexcept>
#include <vector>
#include "common.hpp"
#include "../src/baseline_map.hpp"
#include "../src/flagging.hpp"


void test_no_flagged_antennas(){
    if(!get_bad_ants({}).empty()) throw TestFailed("'test_no_flagged_antennas' failed.");
    std::cout << "'test_no_flagged_antennas' passed." << std::endl;
}


void test_first_antenna_flagged(){
    auto bad = get_bad_ants({0});
    if(bad.size() != 128) throw TestFailed("'test_first_antenna_flagged' failed: wrong number of baselines.");
    for(int i {0}; i < 128; i++)
        if(bad[i] != i) throw TestFailed("'test_first_antenna_flagged' failed: wrong baseline.");
    std::cout << "'test_first_antenna_flagged' passed." << std::endl;
}


void test_all_antennas_flagged(){
    std::vector<int> all;
    for(int i {127}; i >= 0; i--) all.push_back(i);
    auto bad = get_bad_ants(all);
    if(bad.size() != 8256) throw TestFailed("'test_all_antennas_flagged' failed: wrong number of baselines.");
    for(int i {0}; i < 8256; i++)
        if(bad[i] != i) throw TestFailed("'test_all_antennas_flagged' failed: not ascending.");
    std::cout << "'test_all_antennas_flagged' passed." << std::endl;
}


void test_some_antennas_flagged(){
    // repeated antennas are counted once
    auto bad = get_bad_ants({5, 100, 5});
    // 128 baselines per antenna, minus the (5, 100) baseline counted twice
    if(bad.size() != 255) throw TestFailed("'test_some_antennas_flagged' failed: wrong number of baselines.");
    for(size_t i {1}; i < bad.size(); i++)
        if(bad[i] <= bad[i - 1]) throw TestFailed("'test_some_antennas_flagged' failed: not strictly ascending.");
    for(int bls : bad){
        int a1, a2;
        get_antenna_pair_from_baseline(bls, a1, a2);
        if(a1 != 5 && a2 != 5 && a1 != 100 && a2 != 100)
            throw TestFailed("'test_some_antennas_flagged' failed: unflagged baseline returned.");
    }
    std::cout << "'test_some_antennas_flagged' passed." << std::endl;
}


void test_invalid_antenna(){
    bool thrown {false};
    try{
        get_bad_ants({3, 128});
    }catch(const std::out_of_range&){
        thrown = true;
    }
    if(!thrown) throw TestFailed("'test_invalid_antenna' failed: antenna 128 accepted.");
    thrown = false;
    try{
        get_bad_ants({-1});
    }catch(const std::out_of_range&){
        thrown = true;
    }
    if(!thrown) throw TestFailed("'test_invalid_antenna' failed: antenna -1 accepted.");
    std::cout << "'test_invalid_antenna' passed." << std::endl;
}


void test_flagged_antennas_from_metafits(){
    const std::vector<int> antenna_numbers {12, 3, 77, 40, 9};
    const std::vector<int> flags {1, 0, 1, 0, 1};
    auto flagged = get_flagged_antennas(antenna_numbers, flags);
    if(flagged != std::vector<int> {9, 12, 77}) throw TestFailed("'test_flagged_antennas_from_metafits' failed.");

    bool thrown {false};
    try{
        get_flagged_antennas(antenna_numbers, {1, 0});
    }catch(const std::invalid_argument&){
        thrown = true;
    }
    if(!thrown) throw TestFailed("'test_flagged_antennas_from_metafits' failed: length mismatch accepted.");
    std::cout << "'test_flagged_antennas_from_metafits' passed." << std::endl;
}


int main(void){
    try{
        test_no_flagged_antennas();
        test_first_antenna_flagged();
        test_all_antennas_flagged();
        test_some_antennas_flagged();
        test_invalid_antenna();
        test_flagged_antennas_from_metafits();
    } catch (std::exception& ex){
        std::cerr << ex.what() << std::endl;
        return 1;
    }
    
    std::cout << "All tests passed." << std::endl;
    return 0;
}
