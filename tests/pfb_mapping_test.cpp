#include <iostream>
#include <vector>
#include "common.hpp"
#include "../src/pfb_mapping.hpp"


void test_pfb_mapper_is_permutation(){
    std::vector<int> count (PFB_BLOCK_SIZE, 0);
    for(int i {0}; i < PFB_BLOCK_SIZE; i++){
        if(PFB_MAPPER[i] != (i % 4) * 16 + i / 4) throw TestFailed("'test_pfb_mapper_is_permutation' failed: wrong entry.");
        count[PFB_MAPPER[i]]++;
    }
    for(int c : count)
        if(c != 1) throw TestFailed("'test_pfb_mapper_is_permutation' failed: not a permutation.");
    std::cout << "'test_pfb_mapper_is_permutation' passed." << std::endl;
}


void test_pfb_mapping(){
    auto mapping = get_pfb_input_to_output_mapping();
    if(mapping.size() != 256) throw TestFailed("'test_pfb_mapping' failed: wrong size.");
    // input 14 ends up on output 56, in every block.
    if(mapping[14] != 56) throw TestFailed("'test_pfb_mapping' failed: mapping[14] != 56.");
    if(mapping[14 + 64] != 120) throw TestFailed("'test_pfb_mapping' failed: mapping[78] != 120.");
    if(mapping[0] != 0 || mapping[16] != 1 || mapping[1] != 4 || mapping[255] != 255)
        throw TestFailed("'test_pfb_mapping' failed: unexpected values.");
    std::cout << "'test_pfb_mapping' passed." << std::endl;
}


void test_pfb_mapping_is_bijection(){
    auto mapping = get_pfb_input_to_output_mapping();
    std::vector<int> count (256, 0);
    for(int in {0}; in < 256; in++){
        const int out {mapping[in]};
        if(out < 0 || out >= 256) throw TestFailed("'test_pfb_mapping_is_bijection' failed: output out of range.");
        // each block of 64 inputs stays in its block
        if(out / 64 != in / 64) throw TestFailed("'test_pfb_mapping_is_bijection' failed: output in the wrong block.");
        count[out]++;
    }
    for(int c : count)
        if(c != 1) throw TestFailed("'test_pfb_mapping_is_bijection' failed.");
    std::cout << "'test_pfb_mapping_is_bijection' passed." << std::endl;
}


void test_pfb_mapping_deterministic(){
    if(get_pfb_input_to_output_mapping() != get_pfb_input_to_output_mapping())
        throw TestFailed("'test_pfb_mapping_deterministic' failed.");
    std::cout << "'test_pfb_mapping_deterministic' passed." << std::endl;
}


int main(void){
    try{
        test_pfb_mapper_is_permutation();
        test_pfb_mapping();
        test_pfb_mapping_is_bijection();
        test_pfb_mapping_deterministic();
    } catch (std::exception& ex){
        std::cerr << ex.what() << std::endl;
        return 1;
    }
    
    std::cout << "All tests passed." << std::endl;
    return 0;
}
